#include "olresult.h"
#include "icu-iter.h"

#include <algorithm>

bool
byWeight(const OlResult& a, const OlResult& b)
{
  return a.weight < b.weight;
}

void
sortResults(vector<OlResult>& results, const result_order_t& order)
{
  stable_sort(results.begin(), results.end(), order);
}

static bool
isTag(const UString& sym)
{
  return grapheme_count(sym) > 1;
}

OlAnalysis
OlAnalysis::parse(const OlResult& result)
{
  return parse(result.surfaceSymbols);
}

OlAnalysis
OlAnalysis::parse(const vector<UString>& symbols)
{
  OlAnalysis a;
  size_t first = 0;
  while(first < symbols.size() && isTag(symbols[first]))
    first++;
  size_t last = symbols.size();
  while(last > first && isTag(symbols[last-1]))
    last--;
  a.prefixes.assign(symbols.begin(), symbols.begin() + first);
  for(size_t i = first; i < last; i++)
    a.lemma += symbols[i];
  a.suffixes.assign(symbols.begin() + last, symbols.end());
  return a;
}

vector<UString>
OlAnalysis::tags() const
{
  vector<UString> ret;
  for(auto& s : suffixes)
  {
    size_t b = s.find_first_not_of('+');
    size_t e = s.find_last_not_of('+');
    if(b == UString::npos)
      ret.push_back(s);
    else
      ret.push_back(s.substr(b, e - b + 1));
  }
  return ret;
}

UString
OlAnalysis::str() const
{
  UString ret;
  for(auto& p : prefixes)
    ret += p;
  ret += lemma;
  for(auto& s : suffixes)
    ret += s;
  return ret;
}
