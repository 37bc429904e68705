#include "olpair.h"
#include "olreader.h"

#include <algorithm>
#include <limits>

OlPair::OlPair(unique_ptr<OlTransducer> a, unique_ptr<OlTransducer> g)
  : analyserFst(move(a)), generatorFst(move(g)),
    analyser(*analyserFst), generator(*generatorFst)
{}

OlPair::OlPair(const string& analyserPath, const string& generatorPath)
  : OlPair(OlReader().read(analyserPath), OlReader().read(generatorPath))
{}

void
OlPair::setLimits(const LookupLimits& limits)
{
  analyser.setLimits(limits);
  generator.setLimits(limits);
}

void
OlPair::setVerbose(bool val)
{
  analyser.setVerbose(val);
  generator.setVerbose(val);
}

optional<UString>
OlPair::standardize(const vector<UString>& symbols, bool& truncated) const
{
  LookupResult res = generator.lookup(symbols, InputSide);
  truncated = res.truncated;
  optional<UString> entry;
  for(auto& r : res.results)
  {
    if(entry && *entry != r.collapsed)
      return nullopt;
    entry = r.collapsed;
  }
  return entry;
}

optional<UString>
OlPair::standardize(const vector<UString>& symbols) const
{
  bool truncated;
  return standardize(symbols, truncated);
}

PairAnalysis
OlPair::analyse(const UString& surface, const distance_t& distance) const
{
  PairAnalysis ret;
  LookupResult res = analyser.analyse(surface);
  ret.truncated = res.truncated;
  for(auto& r : res.results)
  {
    OlFullAnalysis fa;
    fa.result = r;
    bool truncated;
    fa.standardized = standardize(r.surfaceSymbols, truncated);
    ret.truncated = ret.truncated || truncated;
    ret.results.push_back(fa);
  }
  if(distance)
  {
    auto key = [&](const OlFullAnalysis& fa) {
      if(!fa.standardized)
        return numeric_limits<double>::infinity();
      return distance(surface, *fa.standardized);
    };
    stable_sort(ret.results.begin(), ret.results.end(),
                [&](const OlFullAnalysis& a, const OlFullAnalysis& b) {
      return key(a) < key(b);
    });
  }
  return ret;
}

LookupResult
OlPair::generate(const OlAnalysis& analysis) const
{
  return generator.lookup(analysis.str(), InputSide);
}

LookupResult
OlPair::generate(const vector<UString>& symbols) const
{
  return generator.lookup(symbols, InputSide);
}

LookupResult
OlPair::generate(const UString& analysis) const
{
  return generator.lookup(analysis, InputSide);
}

RoundTrip
OlPair::roundTrip(const UString& surface) const
{
  RoundTrip ret;
  LookupResult res = analyser.analyse(surface);
  ret.truncated = res.truncated;
  for(auto& r : res.results)
  {
    LookupResult gen = generator.lookup(r.surfaceSymbols, InputSide);
    ret.truncated = ret.truncated || gen.truncated;
    ret.results.insert(gen.results.begin(), gen.results.end());
  }
  return ret;
}
