#include "flagdiacritics.h"

void
FlagState::set(int feature, int value)
{
  if((unsigned int)feature >= values.size())
    values.resize(feature + 1, 0);
  values[feature] = value;
}

optional<FlagState>
FlagDiacritics::apply(const FlagState& state, sym_t symbol) const
{
  if(!symbols.isFlag(symbol))
    return state;
  return apply(state, symbols.flag(symbol));
}

optional<FlagState>
FlagDiacritics::apply(const FlagState& state, const flag_op_t& op)
{
  int current = state.get(op.feature);
  switch(op.type)
  {
    case Positive:
    {
      FlagState next = state;
      next.set(op.feature, op.value);
      return next;
    }
    case Negative:
    {
      FlagState next = state;
      next.set(op.feature, -op.value);
      return next;
    }
    case Require:
      if(op.value == 0)
      {
        if(current == 0)
          return nullopt;
      }
      else if(current != op.value)
        return nullopt;
      return state;
    case Disallow:
      if(op.value == 0)
      {
        if(current != 0)
          return nullopt;
      }
      else if(current == op.value)
        return nullopt;
      return state;
    case Clear:
    {
      FlagState next = state;
      next.set(op.feature, 0);
      return next;
    }
    case Unification:
      if(current == 0 || current == op.value || (current < 0 && -current != op.value))
      {
        FlagState next = state;
        next.set(op.feature, op.value);
        return next;
      }
      return nullopt;
  }
  return nullopt;
}
