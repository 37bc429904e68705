#ifndef __OLTRANSDUCER__
#define __OLTRANSDUCER__

#include "olsymbols.h"

#include <lttoolbox/alphabet.h>
#include <lttoolbox/transducer.h>

#include <map>
#include <string>
#include <vector>

using namespace std;

typedef unsigned int state_t;

struct OlTransition
{
  sym_t input;
  sym_t output;
  state_t target;
  float weight;
  bool operator<(const OlTransition& t) const
  {
    return input < t.input || (input == t.input && output < t.output) ||
           (input == t.input && output == t.output && target < t.target);
  }
};

struct OlState
{
  bool final = false;
  float finalWeight = 0;
  vector<OlTransition> transitions;
};

struct OlProperties
{
  bool weighted = false;
  bool deterministic = false;
  bool inputDeterministic = false;
  bool minimized = false;
  bool cyclic = false;
  bool hasEpsilonEpsilonTransitions = false;
  bool hasInputEpsilonTransitions = false;
  bool hasInputEpsilonCycles = false;
  bool hasUnweightedInputEpsilonCycles = false;
};

class OlReader;

// Read-only after construction; queries on one instance need no locking.
class OlTransducer
{
  friend class OlReader;
private:
  vector<OlState> states;
  OlSymbolTable alphabet;
  OlProperties props;
  map<string, string> header;
  string source;
  unsigned int transitionTotal = 0;

  OlTransducer() {}
  void finish();

public:
  state_t initial() const
  {
    return 0;
  }
  unsigned int stateCount() const
  {
    return states.size();
  }
  unsigned int transitionCount() const
  {
    return transitionTotal;
  }
  // sorted by input code, then output code
  const vector<OlTransition>& transitions(state_t state) const
  {
    return states.at(state).transitions;
  }
  bool isFinal(state_t state) const
  {
    return states.at(state).final;
  }
  float finalWeight(state_t state) const;

  const OlSymbolTable& symbols() const
  {
    return alphabet;
  }
  const OlProperties& properties() const
  {
    return props;
  }
  bool isWeighted() const
  {
    return props.weighted;
  }
  const string& filename() const
  {
    return source;
  }
  // value of an HFST3 header field, empty when absent
  string headerValue(const string& key) const;
  string name() const
  {
    return headerValue("name");
  }

  bool hasInputEpsilonCycles() const;
  void printStatistics() const;
  Transducer* toLttoolbox(Alphabet& alpha) const;
};

#endif
