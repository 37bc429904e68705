#include "olsymbols.h"
#include "olerror.h"
#include "icu-iter.h"

#include <algorithm>
#include <stdexcept>

OlSymbolTable::OlSymbolTable()
{
  id_to_value.push_back(UString());
  value_to_id[UString()] = 0;
}

static bool
isSpecial(const UString& name)
{
  return name.size() >= 3 && name.front() == '@' && name.back() == '@';
}

int
OlSymbolTable::internFeature(const UString& name)
{
  if(feature_to_id.find(name) == feature_to_id.end())
  {
    feature_to_id[name] = id_to_feature.size();
    id_to_feature.push_back(name);
  }
  return feature_to_id[name];
}

int
OlSymbolTable::internValue(const UString& name)
{
  if(value_to_id.find(name) == value_to_id.end())
  {
    value_to_id[name] = id_to_value.size();
    id_to_value.push_back(name);
  }
  return value_to_id[name];
}

// @OP.FEATURE.VALUE@ or @OP.FEATURE@
bool
OlSymbolTable::parseFlag(const UString& name, flag_op_t& op)
{
  if(!isSpecial(name) || name.size() < 5 || name[2] != '.')
    return false;
  switch(name[1])
  {
    case 'P': op.type = Positive; break;
    case 'N': op.type = Negative; break;
    case 'R': op.type = Require; break;
    case 'D': op.type = Disallow; break;
    case 'C': op.type = Clear; break;
    case 'U': op.type = Unification; break;
    default: return false;
  }
  UString body = name.substr(3, name.size() - 4);
  size_t dot = body.find('.');
  if(body.empty() || dot == 0)
    return false;
  if(dot == UString::npos)
  {
    op.feature = internFeature(body);
    op.value = 0;
  }
  else
  {
    op.feature = internFeature(body.substr(0, dot));
    op.value = internValue(body.substr(dot + 1));
  }
  return true;
}

sym_t
OlSymbolTable::intern(const UString& name)
{
  auto it = name_to_id.find(name);
  if(it != name_to_id.end())
    return it->second;
  sym_t code = id_to_name.size();
  name_to_id[name] = code;
  id_to_name.push_back(name);
  // code 0 is epsilon whatever the file calls it
  if(code == EPSILON_SYMBOL)
    return code;
  flag_op_t op;
  if(parseFlag(name, op))
    flags[code] = op;
  else if(name == u"@_IDENTITY_SYMBOL_@")
    identity = code;
  else if(name == u"@_UNKNOWN_SYMBOL_@")
    unknown = code;
  else if(!isSpecial(name) && name.size() > longestSymbol)
    longestSymbol = name.size();
  return code;
}

const UString&
OlSymbolTable::lookup(sym_t code) const
{
  if(code < 0 || (unsigned int)code >= id_to_name.size())
    throw out_of_range("symbol code " + to_string(code) + " is not in the alphabet");
  return id_to_name[code];
}

sym_t
OlSymbolTable::find(const UString& name) const
{
  auto it = name_to_id.find(name);
  if(it == name_to_id.end())
    return NO_SYMBOL;
  return it->second;
}

const flag_op_t&
OlSymbolTable::flag(sym_t code) const
{
  auto it = flags.find(code);
  if(it == flags.end())
    throw out_of_range("symbol code " + to_string(code) + " is not a flag diacritic");
  return it->second;
}

UString
OlSymbolTable::surface(sym_t code) const
{
  if(code == EPSILON_SYMBOL || isFlag(code))
    return UString();
  const UString& name = lookup(code);
  if(isSpecial(name))
    return UString();
  return name;
}

const UString&
OlSymbolTable::featureName(int feature) const
{
  return id_to_feature.at(feature);
}

const UString&
OlSymbolTable::valueName(int value) const
{
  return id_to_value.at(value);
}

vector<token_t>
OlSymbolTable::tokenize(const UString& input, unsigned int limit) const
{
  vector<token_t> tokens;
  size_t pos = 0;
  while(pos < input.size())
  {
    size_t len = min((size_t)longestSymbol, input.size() - pos);
    sym_t match = NO_SYMBOL;
    for(; len > 0; len--)
    {
      auto it = name_to_id.find(input.substr(pos, len));
      if(it == name_to_id.end())
        continue;
      sym_t code = it->second;
      if(code == EPSILON_SYMBOL || (unsigned int)code >= limit || isFlag(code) || isSpecial(it->first))
        continue;
      match = code;
      break;
    }
    if(match != NO_SYMBOL)
    {
      tokens.push_back({match, input.substr(pos, len)});
      pos += len;
    }
    else
    {
      charspan_iter ch(input, pos);
      size_t end = ch.span().second;
      if(ch.at_end() || end <= pos)
        end = pos + 1;
      tokens.push_back({NO_SYMBOL, input.substr(pos, end - pos)});
      pos = end;
    }
  }
  return tokens;
}

vector<sym_t>
OlSymbolTable::encode(const vector<UString>& symbols) const
{
  vector<sym_t> codes;
  for(auto& s : symbols)
  {
    sym_t code = find(s);
    if(code == NO_SYMBOL)
      throw UnknownSymbolError(to_utf8(s));
    codes.push_back(code);
  }
  return codes;
}
