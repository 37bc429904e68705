#ifndef __OLPAIR__
#define __OLPAIR__

#include "ollookup.h"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

using namespace std;

typedef function<double(const UString&, const UString&)> distance_t;

struct PairAnalysis
{
  vector<OlFullAnalysis> results;
  // a limit cut the analyser or the generator short
  bool truncated = false;
};

struct RoundTrip
{
  set<OlResult> results;
  bool truncated = false;
};

// An analyser (surface -> analysis) and a generator (analysis -> surface)
// over the same tag alphabet.
class OlPair
{
private:
  unique_ptr<OlTransducer> analyserFst;
  unique_ptr<OlTransducer> generatorFst;
  OlLookup analyser;
  OlLookup generator;

  optional<UString> standardize(const vector<UString>& symbols, bool& truncated) const;

public:
  OlPair(unique_ptr<OlTransducer> analyserFst, unique_ptr<OlTransducer> generatorFst);
  OlPair(const string& analyserPath, const string& generatorPath);

  void setLimits(const LookupLimits& limits);
  void setVerbose(bool val);
  const OlLookup& getAnalyser() const
  {
    return analyser;
  }
  const OlLookup& getGenerator() const
  {
    return generator;
  }

  // Analyses of surface, each with the generator's form of it when the
  // generator agrees on a single one. With a distance, results are
  // ordered by distance(surface, standardized), unstandardized last.
  PairAnalysis analyse(const UString& surface, const distance_t& distance = nullptr) const;
  optional<UString> standardize(const vector<UString>& symbols) const;

  LookupResult generate(const OlAnalysis& analysis) const;
  LookupResult generate(const vector<UString>& symbols) const;
  LookupResult generate(const UString& analysis) const;

  // every surface result the generator gives for any analysis of surface
  RoundTrip roundTrip(const UString& surface) const;
};

#endif
