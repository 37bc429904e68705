#include "oltransducer.h"

#include <unicode/unistr.h>
#include <algorithm>
#include <iostream>
#include <deque>
#include <stdexcept>

using namespace icu;

void
OlTransducer::finish()
{
  transitionTotal = 0;
  for(auto& st : states)
  {
    sort(st.transitions.begin(), st.transitions.end());
    transitionTotal += st.transitions.size();
  }
}

float
OlTransducer::finalWeight(state_t state) const
{
  const OlState& st = states.at(state);
  if(!st.final)
    throw out_of_range("state " + to_string(state) + " is not final");
  return st.finalWeight;
}

string
OlTransducer::headerValue(const string& key) const
{
  auto it = header.find(key);
  if(it == header.end())
    return "";
  return it->second;
}

// An input-side cycle that consumes nothing makes the transducer
// infinitely ambiguous.
bool
OlTransducer::hasInputEpsilonCycles() const
{
  // 0 = unvisited, 1 = on stack, 2 = done
  vector<char> mark(states.size(), 0);
  for(state_t root = 0; root < states.size(); root++)
  {
    if(mark[root])
      continue;
    vector<pair<state_t, unsigned int>> stack;
    stack.push_back(make_pair(root, 0));
    mark[root] = 1;
    while(!stack.empty())
    {
      state_t s = stack.back().first;
      unsigned int& next = stack.back().second;
      const vector<OlTransition>& trans = states[s].transitions;
      bool descended = false;
      while(next < trans.size())
      {
        const OlTransition& tr = trans[next++];
        if(!alphabet.isZeroWidth(tr.input))
          continue;
        if(mark[tr.target] == 1)
          return true;
        if(mark[tr.target] == 0)
        {
          mark[tr.target] = 1;
          stack.push_back(make_pair(tr.target, 0));
          descended = true;
          break;
        }
      }
      if(!descended)
      {
        mark[s] = 2;
        stack.pop_back();
      }
    }
  }
  return false;
}

void
OlTransducer::printStatistics() const
{
  if(!name().empty())
    cerr << "Name: " << name() << endl;
  cerr << "Type: " << (props.weighted ? "HFST_OLW" : "HFST_OL") << endl;
  cerr << "States: " << states.size() << endl;
  cerr << "Transitions: " << transitionTotal << endl;
  unsigned int finals = 0;
  for(const auto& st : states)
    if(st.final)
      finals++;
  cerr << "Final states: " << finals << endl;
  cerr << "Symbols: " << alphabet.size() << " (" << alphabet.inputSymbolCount() << " input)" << endl;
  cerr << "Flag features: " << alphabet.featureCount() << endl;
  for(unsigned int f = 0; f < alphabet.featureCount(); f++)
    cerr << "  " << alphabet.featureName(f) << endl;
}

static int
ltSymbol(const OlSymbolTable& symbols, Alphabet& alpha, sym_t code)
{
  if(code == EPSILON_SYMBOL)
    return 0;
  const UString& name = symbols.lookup(code);
  if(name.empty())
    return 0;
  UnicodeString symbol(name.data(), (int32_t)name.size());
  if(!symbol.hasMoreChar32Than(0, symbol.length(), 1))
    return (int)symbol.char32At(0);
  alpha.includeSymbol(name);
  return alpha(name);
}

Transducer*
OlTransducer::toLttoolbox(Alphabet& alpha) const
{
  Transducer* t = new Transducer();
  vector<int> ltState(states.size(), -1);
  deque<state_t> todo;
  ltState[initial()] = t->getInitial();
  todo.push_back(initial());
  while(!todo.empty())
  {
    state_t s = todo.front();
    todo.pop_front();
    for(const auto& tr : states[s].transitions)
    {
      int l = ltSymbol(alphabet, alpha, tr.input);
      int r = ltSymbol(alphabet, alpha, tr.output);
      int tag = alpha(l, r);
      if(ltState[tr.target] == -1)
      {
        ltState[tr.target] = t->insertNewSingleTransduction(tag, ltState[s], tr.weight);
        todo.push_back(tr.target);
      }
      else
      {
        t->linkStates(ltState[s], ltState[tr.target], tag, tr.weight);
      }
    }
  }
  for(state_t s = 0; s < states.size(); s++)
  {
    if(states[s].final && ltState[s] != -1)
      t->setFinal(ltState[s], states[s].finalWeight);
  }
  return t;
}
