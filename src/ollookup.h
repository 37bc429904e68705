#ifndef __OLLOOKUP__
#define __OLLOOKUP__

#include "oltransducer.h"
#include "flagdiacritics.h"
#include "olresult.h"

#include <functional>
#include <map>
#include <set>
#include <vector>

using namespace std;

// Which side of the arcs is matched against the query; the other side is
// emitted. Input drives analysis, Output drives generation.
enum Side
{
  InputSide = 0,
  OutputSide = 1
};

struct LookupLimits
{
  long maxSteps = -1;       // -1 = unlimited
  long maxResults = -1;     // -1 = unlimited
  double timeCutoff = 60;   // seconds, <= 0 = unlimited
};

struct LookupResult
{
  vector<OlResult> results;
  // a limit stopped the search; results are partial
  bool truncated = false;
};

typedef function<bool(const OlResult&)> result_visitor_t;

// What became of an accepting path handed to the search. Only new paths
// count towards LookupLimits::maxResults.
enum PathVerdict
{
  PathNew,
  PathDuplicate,
  PathStop
};

typedef function<PathVerdict(const vector<sym_t>&, double)> path_accept_t;

class OlLookup
{
private:
  const OlTransducer& fst;
  FlagDiacritics flags;
  LookupLimits limits;
  bool verbose = false;

  bool canConsume(const vector<token_t>& tokens) const;
  vector<token_t> tokenize(const UString& input, Side side) const;
  bool search(const vector<token_t>& tokens, Side side, const path_accept_t& accept) const;
  OlResult assemble(const vector<sym_t>& path, double weight, const vector<token_t>& tokens) const;
  LookupResult collect(const vector<token_t>& tokens, Side side) const;

public:
  explicit OlLookup(const OlTransducer& t);

  void setLimits(const LookupLimits& val)
  {
    limits = val;
  }
  const LookupLimits& getLimits() const
  {
    return limits;
  }
  void setVerbose(bool val)
  {
    verbose = val;
  }
  const OlTransducer& transducer() const
  {
    return fst;
  }

  // Each distinct result is passed to visit as soon as it is found;
  // returning false from visit ends the search. Returns true when a limit
  // cut the search short.
  bool lookup(const UString& input, Side side, const result_visitor_t& visit) const;
  LookupResult lookup(const UString& input, Side side = InputSide) const;
  LookupResult lookup(const vector<UString>& symbols, Side side = InputSide) const;

  LookupResult analyse(const UString& surface) const
  {
    return lookup(surface, InputSide);
  }
  LookupResult generate(const UString& analysis) const
  {
    return lookup(analysis, OutputSide);
  }
  LookupResult generate(const vector<UString>& symbols) const
  {
    return lookup(symbols, OutputSide);
  }

  // collapsed strings of the results, lowest weight first
  vector<UString> lookupStrings(const UString& input) const;
  map<UString, set<UString>> bulkLookup(const vector<UString>& words) const;
};

#endif
