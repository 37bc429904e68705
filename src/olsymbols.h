#ifndef __OLSYMBOLS__
#define __OLSYMBOLS__

#include <lttoolbox/ustring.h>

#include <map>
#include <string>
#include <vector>

using namespace std;

typedef int sym_t;

const sym_t EPSILON_SYMBOL = 0;
const sym_t NO_SYMBOL = -1;

enum FlagDiacriticType
{
  Positive,
  Negative,
  Require,
  Disallow,
  Clear,
  Unification
};

struct flag_op_t {
  FlagDiacriticType type;
  int feature;
  int value; // 0 = no value
};

// A segment of a query string. code is NO_SYMBOL when the segment is not
// in the alphabet; such tokens can only be consumed by identity or
// unknown arcs.
struct token_t {
  sym_t code;
  UString text;
  bool operator==(const token_t &t) const
  {
    return code == t.code && text == t.text;
  }
};

class OlSymbolTable
{
private:
  map<UString, sym_t> name_to_id;
  vector<UString> id_to_name;
  map<sym_t, flag_op_t> flags;

  map<UString, int> feature_to_id;
  vector<UString> id_to_feature;
  map<UString, int> value_to_id;
  vector<UString> id_to_value;

  sym_t identity = NO_SYMBOL;
  sym_t unknown = NO_SYMBOL;
  unsigned int inputCount = 0;
  unsigned int longestSymbol = 0;

  int internFeature(const UString& name);
  int internValue(const UString& name);
  bool parseFlag(const UString& name, flag_op_t& op);

public:
  OlSymbolTable();
  sym_t intern(const UString& name);
  const UString& lookup(sym_t code) const;
  sym_t find(const UString& name) const;

  bool isFlag(sym_t code) const
  {
    return flags.find(code) != flags.end();
  }
  const flag_op_t& flag(sym_t code) const;
  bool isEpsilon(sym_t code) const
  {
    return code == EPSILON_SYMBOL;
  }
  // epsilon and flag diacritics consume nothing
  bool isZeroWidth(sym_t code) const
  {
    return code == EPSILON_SYMBOL || isFlag(code);
  }
  // printed form: empty for epsilon, flags and unrecognised @...@ specials
  UString surface(sym_t code) const;

  sym_t identitySymbol() const
  {
    return identity;
  }
  sym_t unknownSymbol() const
  {
    return unknown;
  }

  unsigned int size() const
  {
    return id_to_name.size();
  }
  unsigned int inputSymbolCount() const
  {
    return inputCount;
  }
  void setInputSymbolCount(unsigned int count)
  {
    inputCount = count;
  }
  unsigned int featureCount() const
  {
    return id_to_feature.size();
  }
  const UString& featureName(int feature) const;
  const UString& valueName(int value) const;

  // longest match over the ordinary symbols with codes below limit
  vector<token_t> tokenize(const UString& input, unsigned int limit) const;
  vector<token_t> tokenize(const UString& input) const
  {
    return tokenize(input, size());
  }
  vector<sym_t> encode(const vector<UString>& symbols) const;
};

#endif
