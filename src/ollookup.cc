#include "ollookup.h"
#include "olerror.h"

#include <chrono>
#include <iostream>

using namespace std::chrono;

// Input tokens echoed through identity arcs are stored in the output path
// as -(position + 2), keeping NO_SYMBOL free.
static inline sym_t
echo(size_t pos)
{
  return -(sym_t)pos - 2;
}

struct Traversal
{
  const OlTransducer& fst;
  const OlSymbolTable& symbols;
  const FlagDiacritics& flags;
  const LookupLimits& limits;
  const vector<token_t>& tokens;
  Side side;
  const path_accept_t& accept;

  steady_clock::time_point started;
  long steps = 0;
  long found = 0;
  bool truncated = false;
  bool stopped = false;

  vector<sym_t> output;
  // (state, flags) pairs reached at the current input position; a
  // zero-width move back into one of them makes no progress
  vector<pair<state_t, FlagState>> trail;

  Traversal(const OlTransducer& fst, const FlagDiacritics& flags, const LookupLimits& limits,
            const vector<token_t>& tokens, Side side, const path_accept_t& accept)
    : fst(fst), symbols(fst.symbols()), flags(flags), limits(limits),
      tokens(tokens), side(side), accept(accept), started(steady_clock::now())
  {}

  bool onTrail(state_t s, const FlagState& fs) const
  {
    for(auto& it : trail)
      if(it.first == s && it.second == fs)
        return true;
    return false;
  }

  bool overBudget()
  {
    if(limits.maxSteps >= 0 && steps >= limits.maxSteps)
      return true;
    steps++;
    if(limits.timeCutoff > 0 && (steps & 0xFF) == 0)
    {
      duration<double> elapsed = steady_clock::now() - started;
      if(elapsed.count() > limits.timeCutoff)
        return true;
    }
    return false;
  }

  void zeroWidth(const OlTransition& tr, sym_t emit, size_t pos, const FlagState& fs, double weight)
  {
    if(onTrail(tr.target, fs))
      return;
    trail.push_back(make_pair(tr.target, fs));
    if(emit != EPSILON_SYMBOL)
      output.push_back(emit);
    visit(tr.target, pos, fs, weight + tr.weight);
    if(emit != EPSILON_SYMBOL)
      output.pop_back();
    trail.pop_back();
  }

  void consume(const OlTransition& tr, sym_t emit, size_t pos, const FlagState& fs, double weight)
  {
    vector<pair<state_t, FlagState>> saved;
    saved.swap(trail);
    trail.push_back(make_pair(tr.target, fs));
    if(emit != EPSILON_SYMBOL)
      output.push_back(emit);
    visit(tr.target, pos + 1, fs, weight + tr.weight);
    if(emit != EPSILON_SYMBOL)
      output.pop_back();
    trail.swap(saved);
  }

  void visit(state_t s, size_t pos, const FlagState& fs, double weight)
  {
    if(stopped)
      return;
    if(overBudget())
    {
      truncated = stopped = true;
      return;
    }
    if(pos == tokens.size() && fst.isFinal(s))
    {
      if(limits.maxResults >= 0 && found >= limits.maxResults)
      {
        truncated = stopped = true;
        return;
      }
      switch(accept(output, weight + fst.finalWeight(s)))
      {
        case PathNew:
          found++;
          break;
        case PathDuplicate:
          break;
        case PathStop:
          stopped = true;
          return;
      }
    }
    for(const OlTransition& tr : fst.transitions(s))
    {
      if(stopped)
        return;
      sym_t drive = (side == InputSide) ? tr.input : tr.output;
      sym_t emit = (side == InputSide) ? tr.output : tr.input;
      if(symbols.isFlag(drive))
      {
        optional<FlagState> next = flags.apply(fs, drive);
        if(next)
          zeroWidth(tr, emit, pos, *next, weight);
      }
      else if(drive == EPSILON_SYMBOL)
      {
        zeroWidth(tr, emit, pos, fs, weight);
      }
      else if(pos < tokens.size())
      {
        const token_t& tok = tokens[pos];
        if(tok.code != NO_SYMBOL)
        {
          if(drive == tok.code)
            consume(tr, emit, pos, fs, weight);
        }
        else if(drive == symbols.identitySymbol() || drive == symbols.unknownSymbol())
        {
          bool echoes = (emit == symbols.identitySymbol() || emit == symbols.unknownSymbol());
          consume(tr, echoes ? echo(pos) : emit, pos, fs, weight);
        }
      }
    }
  }
};

OlLookup::OlLookup(const OlTransducer& t)
  : fst(t), flags(t.symbols())
{}

bool
OlLookup::canConsume(const vector<token_t>& tokens) const
{
  const OlSymbolTable& syms = fst.symbols();
  bool wildcard = syms.identitySymbol() != NO_SYMBOL || syms.unknownSymbol() != NO_SYMBOL;
  for(auto& tok : tokens)
  {
    if(tok.code == NO_SYMBOL && !wildcard)
    {
      if(verbose)
        cerr << "Unknown symbol '" << tok.text << "'" << endl;
      return false;
    }
  }
  return true;
}

vector<token_t>
OlLookup::tokenize(const UString& input, Side side) const
{
  const OlSymbolTable& syms = fst.symbols();
  unsigned int limit = syms.size();
  if(side == InputSide && syms.inputSymbolCount() > 0)
    limit = syms.inputSymbolCount();
  return syms.tokenize(input, limit);
}

bool
OlLookup::search(const vector<token_t>& tokens, Side side, const path_accept_t& accept) const
{
  Traversal tr(fst, flags, limits, tokens, side, accept);
  tr.trail.push_back(make_pair(fst.initial(), flags.initial()));
  tr.visit(fst.initial(), 0, flags.initial(), 0.0);
  if(verbose && tr.truncated)
    cerr << "WARNING: search stopped after " << tr.steps << " steps" << endl;
  return tr.truncated;
}

OlResult
OlLookup::assemble(const vector<sym_t>& path, double weight, const vector<token_t>& tokens) const
{
  const OlSymbolTable& syms = fst.symbols();
  OlResult r;
  r.weight = weight;
  for(sym_t code : path)
  {
    if(code < NO_SYMBOL)
    {
      const UString& text = tokens[-code - 2].text;
      r.symbols.push_back(text);
      r.surfaceSymbols.push_back(text);
      r.collapsed += text;
      continue;
    }
    r.symbols.push_back(syms.lookup(code));
    UString surface = syms.surface(code);
    if(!surface.empty())
    {
      r.surfaceSymbols.push_back(surface);
      r.collapsed += surface;
    }
  }
  return r;
}

LookupResult
OlLookup::collect(const vector<token_t>& tokens, Side side) const
{
  LookupResult ret;
  if(!canConsume(tokens))
    return ret;
  // the same symbol sequence can be reached along several paths; keep
  // the lightest one
  map<vector<sym_t>, size_t> seen;
  ret.truncated = search(tokens, side, [&](const vector<sym_t>& path, double weight) {
    auto it = seen.find(path);
    if(it == seen.end())
    {
      seen[path] = ret.results.size();
      ret.results.push_back(assemble(path, weight, tokens));
      return PathNew;
    }
    if(weight < ret.results[it->second].weight)
      ret.results[it->second].weight = weight;
    return PathDuplicate;
  });
  return ret;
}

bool
OlLookup::lookup(const UString& input, Side side, const result_visitor_t& visit) const
{
  vector<token_t> tokens = tokenize(input, side);
  if(!canConsume(tokens))
    return false;
  set<vector<sym_t>> seen;
  return search(tokens, side, [&](const vector<sym_t>& path, double weight) {
    if(!seen.insert(path).second)
      return PathDuplicate;
    return visit(assemble(path, weight, tokens)) ? PathNew : PathStop;
  });
}

LookupResult
OlLookup::lookup(const UString& input, Side side) const
{
  return collect(tokenize(input, side), side);
}

LookupResult
OlLookup::lookup(const vector<UString>& symbols, Side side) const
{
  vector<token_t> tokens;
  try
  {
    vector<sym_t> codes = fst.symbols().encode(symbols);
    for(size_t i = 0; i < codes.size(); i++)
      tokens.push_back({codes[i], symbols[i]});
  }
  catch(const UnknownSymbolError& e)
  {
    // no path can produce a symbol the transducer does not have
    if(verbose)
      cerr << e.what() << endl;
    return LookupResult();
  }
  return collect(tokens, side);
}

vector<UString>
OlLookup::lookupStrings(const UString& input) const
{
  LookupResult res = lookup(input, InputSide);
  sortResults(res.results);
  vector<UString> ret;
  for(auto& r : res.results)
    ret.push_back(r.collapsed);
  return ret;
}

map<UString, set<UString>>
OlLookup::bulkLookup(const vector<UString>& words) const
{
  map<UString, set<UString>> ret;
  for(auto& w : words)
  {
    vector<UString> outputs = lookupStrings(w);
    ret[w].insert(outputs.begin(), outputs.end());
  }
  return ret;
}
