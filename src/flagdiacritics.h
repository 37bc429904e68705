#ifndef __OLFLAGDIACRITICS__
#define __OLFLAGDIACRITICS__

#include "olsymbols.h"

#include <optional>
#include <vector>

using namespace std;

// Feature assignments along one traversal path, indexed by feature code.
// 0 = unset, v > 0 = set to value v, v < 0 = set to anything but -v.
class FlagState
{
private:
  vector<int> values;
public:
  FlagState() {}
  explicit FlagState(unsigned int featureCount) : values(featureCount, 0) {}
  int get(int feature) const
  {
    return ((unsigned int)feature < values.size()) ? values[feature] : 0;
  }
  void set(int feature, int value);
  bool operator==(const FlagState &other) const
  {
    return values == other.values;
  }
  bool operator!=(const FlagState &other) const
  {
    return !(*this == other);
  }
  bool operator<(const FlagState &other) const
  {
    return values < other.values;
  }
};

class FlagDiacritics
{
private:
  const OlSymbolTable& symbols;
public:
  explicit FlagDiacritics(const OlSymbolTable& symbols) : symbols(symbols) {}
  FlagState initial() const
  {
    return FlagState(symbols.featureCount());
  }
  // successor state, or nullopt when the flag rejects the path
  optional<FlagState> apply(const FlagState& state, sym_t symbol) const;
  static optional<FlagState> apply(const FlagState& state, const flag_op_t& op);
};

#endif
