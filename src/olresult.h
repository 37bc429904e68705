#ifndef __OLRESULT__
#define __OLRESULT__

#include <lttoolbox/ustring.h>

#include <functional>
#include <optional>
#include <vector>

using namespace std;

// One accepted path. Two results are the same result only when their full
// symbol sequences, flag diacritics included, are identical.
struct OlResult
{
  vector<UString> symbols;
  // unspecified for unweighted transducers (0 as read here)
  double weight = 0;
  // symbols with flag diacritics and specials elided
  vector<UString> surfaceSymbols;
  UString collapsed;

  bool operator==(const OlResult& other) const
  {
    return symbols == other.symbols;
  }
  bool operator!=(const OlResult& other) const
  {
    return !(*this == other);
  }
  bool operator<(const OlResult& other) const
  {
    return symbols < other.symbols;
  }
};

typedef function<bool(const OlResult&, const OlResult&)> result_order_t;

bool byWeight(const OlResult& a, const OlResult& b);
void sortResults(vector<OlResult>& results, const result_order_t& order = byWeight);

// An analysis split into prefix tags, lemma and suffix tags. A symbol
// counts as a tag when it is longer than one grapheme cluster.
struct OlAnalysis
{
  vector<UString> prefixes;
  UString lemma;
  vector<UString> suffixes;

  static OlAnalysis parse(const OlResult& result);
  static OlAnalysis parse(const vector<UString>& symbols);
  // suffixes without their + delimiters
  vector<UString> tags() const;
  UString str() const;
};

struct OlFullAnalysis
{
  OlResult result;
  // the generator's surface form when it gives exactly one
  optional<UString> standardized;

  OlAnalysis analysis() const
  {
    return OlAnalysis::parse(result);
  }
};

#endif
