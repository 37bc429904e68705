#include "olreader.h"
#include "olerror.h"
#include "icu-iter.h"

#include <cstdio>
#include <cstring>
#include <deque>
#include <iostream>
#include <map>
#include <set>

const uint16_t NO_SYMBOL_NUMBER = 0xFFFF;
const uint32_t NO_TABLE_INDEX = 0xFFFFFFFF;
const uint32_t TARGET_TABLE = 0x80000000;
const size_t HEADER_SIZE = 2*2 + 4*4 + 9*4;

void
OlReader::die(const string& msg)
{
  throw FormatError(source, msg);
}

void
OlReader::need(size_t n, const char* what)
{
  if(len - pos < n)
    die(string("truncated ") + what + " at byte " + to_string(pos));
}

uint16_t
OlReader::read_u16()
{
  uint16_t v = buf[pos] | (buf[pos+1] << 8);
  pos += 2;
  return v;
}

uint32_t
OlReader::read_u32()
{
  uint32_t v = (uint32_t)buf[pos] | ((uint32_t)buf[pos+1] << 8) |
               ((uint32_t)buf[pos+2] << 16) | ((uint32_t)buf[pos+3] << 24);
  pos += 4;
  return v;
}

float
OlReader::read_f32()
{
  uint32_t bits = read_u32();
  float f;
  memcpy(&f, &bits, sizeof(f));
  return f;
}

// Fail before parsing anything when the input is in a source format that
// needs an external conversion step.
void
OlReader::checkMagic()
{
  if(len >= 2 && buf[0] == 0x1f && buf[1] == 0x8b)
    throw CompressedInputError(source);
  const char foma[] = "##foma-net";
  if(len >= sizeof(foma) - 1 && memcmp(buf, foma, sizeof(foma) - 1) == 0)
    die("foma network; convert it with hfst-fst2fst -O before loading");
}

// "HFST\0", u16 length, "\0", then length bytes of key\0value\0 pairs
void
OlReader::readContainerHeader(OlTransducer& t)
{
  if(len < 5 || memcmp(buf, "HFST", 5) != 0)
    return;
  pos = 5;
  need(3, "HFST3 header");
  uint16_t size = read_u16();
  if(buf[pos++] != 0)
    die("broken HFST3 header");
  need(size, "HFST3 header");
  if(size == 0 || buf[pos + size - 1] != 0)
    die("broken HFST3 header");
  vector<string> fields;
  size_t start = pos;
  for(size_t i = pos; i < pos + size; i++)
  {
    if(buf[i] == 0)
    {
      fields.push_back(string((const char*)buf + start, i - start));
      start = i + 1;
    }
  }
  pos += size;
  for(size_t i = 0; i + 1 < fields.size(); i += 2)
    t.header[fields[i]] = fields[i+1];

  string version = t.headerValue("version");
  if(!version.empty() && version.substr(0, version.find('.')) != "3")
    die("unsupported HFST header version " + version);
  string type = t.headerValue("type");
  if(!type.empty() && type != "HFST_OL" && type != "HFST_OLW")
    die("transducer type " + type + " is not optimized-lookup; convert it with hfst-fst2fst -O");
}

void
OlReader::readHeader(OlTransducer& t)
{
  need(HEADER_SIZE, "header");
  inputSymbols = read_u16();
  symbolCount = read_u16();
  indexSize = read_u32();
  targetSize = read_u32();
  uint32_t stateCount = read_u32();
  uint32_t transitionCount = read_u32();
  bool* flags[] = {
    &t.props.weighted, &t.props.deterministic, &t.props.inputDeterministic,
    &t.props.minimized, &t.props.cyclic, &t.props.hasEpsilonEpsilonTransitions,
    &t.props.hasInputEpsilonTransitions, &t.props.hasInputEpsilonCycles,
    &t.props.hasUnweightedInputEpsilonCycles
  };
  for(bool* f : flags)
    *f = (read_u32() != 0);

  if(symbolCount == 0)
    die("empty symbol table");
  if(inputSymbols > symbolCount)
    die("more input symbols (" + to_string(inputSymbols) + ") than symbols (" + to_string(symbolCount) + ")");
  if(indexSize == 0 && targetSize == 0)
    die("no states");
  if(verbose)
  {
    cerr << source << ": " << symbolCount << " symbols, " << stateCount << " states, "
         << transitionCount << " transitions" << (t.props.weighted ? ", weighted" : "") << endl;
  }
}

void
OlReader::readSymbols(OlTransducer& t)
{
  fileToCode.clear();
  zeroWidth.clear();
  for(unsigned int k = 0; k < symbolCount; k++)
  {
    const unsigned char* end = (const unsigned char*)memchr(buf + pos, 0, len - pos);
    if(end == nullptr)
      die("truncated symbol table (symbol " + to_string(k) + ")");
    UString name = utf8_to_ustring((const char*)buf + pos, end - (buf + pos));
    pos = (end - buf) + 1;
    if(k == 0)
      name.clear();
    sym_t code = t.alphabet.intern(name);
    if(k > 0 && code == EPSILON_SYMBOL)
      die("symbol " + to_string(k) + " duplicates epsilon");
    fileToCode.push_back(code);
    zeroWidth.push_back(t.alphabet.isZeroWidth(code));
  }
  t.alphabet.setInputSymbolCount(inputSymbols);
}

void
OlReader::readTables(bool weighted)
{
  need((size_t)indexSize * 6, "index table");
  indices.resize(indexSize);
  for(auto& e : indices)
  {
    e.input = read_u16();
    e.target = read_u32();
  }
  need((size_t)targetSize * (weighted ? 12 : 8), "transition table");
  entries.resize(targetSize);
  for(auto& e : entries)
  {
    e.input = read_u16();
    e.output = read_u16();
    e.target = read_u32();
    e.weight = weighted ? read_f32() : 0.0;
  }
}

sym_t
OlReader::symbol(uint32_t number, const char* side)
{
  if(number >= fileToCode.size())
    die(string(side) + " symbol " + to_string(number) + " is outside the alphabet");
  return fileToCode[number];
}

// Decode the state stored at address into finality and the transition
// table rows holding its arcs.
void
OlReader::readState(uint32_t address, OlState& st, vector<uint32_t>& arcs, bool weighted)
{
  set<uint32_t> rows;
  if(address < TARGET_TABLE)
  {
    if(address >= indices.size())
      die("state address " + to_string(address) + " is outside the index table");
    const index_entry_t& fin = indices[address];
    if(fin.input == NO_SYMBOL_NUMBER && fin.target != NO_TABLE_INDEX)
    {
      st.final = true;
      if(weighted)
        memcpy(&st.finalWeight, &fin.target, sizeof(float));
    }
    for(uint32_t s = 0; s < inputSymbols; s++)
    {
      size_t slot = (size_t)address + 1 + s;
      if(slot >= indices.size())
        break;
      if(indices[slot].input != s)
        continue;
      uint32_t target = indices[slot].target;
      if(target < TARGET_TABLE || target - TARGET_TABLE >= entries.size())
        die("index entry " + to_string(slot) + " points outside the transition table");
      // epsilon and flag arcs share the epsilon slot
      for(size_t row = target - TARGET_TABLE; row < entries.size(); row++)
      {
        uint16_t in = entries[row].input;
        if(in != s && !(s == 0 && in < zeroWidth.size() && zeroWidth[in]))
          break;
        rows.insert(row);
      }
    }
  }
  else
  {
    uint32_t row = address - TARGET_TABLE;
    if(row >= entries.size())
      die("state address " + to_string(address) + " is outside the transition table");
    const trans_entry_t& fin = entries[row];
    if(fin.input != NO_SYMBOL_NUMBER || fin.output != NO_SYMBOL_NUMBER)
      die("address " + to_string(address) + " does not point at a state");
    if(fin.target == 1)
    {
      st.final = true;
      st.finalWeight = fin.weight;
    }
    for(row++; row < entries.size() && entries[row].input != NO_SYMBOL_NUMBER; row++)
      rows.insert(row);
  }
  arcs.assign(rows.begin(), rows.end());
}

void
OlReader::buildStates(OlTransducer& t)
{
  bool weighted = t.props.weighted;
  map<uint32_t, state_t> ids;
  deque<uint32_t> todo;
  uint32_t start = indices.empty() ? TARGET_TABLE : 0;
  ids[start] = 0;
  todo.push_back(start);
  t.states.push_back(OlState());
  vector<uint32_t> arcs;
  while(!todo.empty())
  {
    uint32_t address = todo.front();
    todo.pop_front();
    state_t id = ids[address];
    OlState st;
    readState(address, st, arcs, weighted);
    for(uint32_t row : arcs)
    {
      const trans_entry_t& e = entries[row];
      OlTransition tr;
      tr.input = symbol(e.input, "input");
      tr.output = symbol(e.output, "output");
      tr.weight = e.weight;
      auto it = ids.find(e.target);
      if(it == ids.end())
      {
        if(e.target == NO_TABLE_INDEX)
          die("transition " + to_string(row) + " has no target");
        state_t next = t.states.size();
        ids[e.target] = next;
        t.states.push_back(OlState());
        todo.push_back(e.target);
        tr.target = next;
      }
      else
      {
        tr.target = it->second;
      }
      st.transitions.push_back(tr);
    }
    t.states[id] = st;
  }
  t.finish();
}

unique_ptr<OlTransducer>
OlReader::read(const unsigned char* data, size_t size, const string& name)
{
  source = name;
  buf = data;
  len = size;
  pos = 0;
  indices.clear();
  entries.clear();

  unique_ptr<OlTransducer> t(new OlTransducer());
  t->source = name;
  checkMagic();
  readContainerHeader(*t);
  readHeader(*t);
  readSymbols(*t);
  readTables(t->props.weighted);
  if(pos < len)
  {
    if(len - pos >= 5 && memcmp(buf + pos, "HFST", 5) == 0)
      die("expected a single transducer, found more");
    die("unexpected data after the transition table at byte " + to_string(pos));
  }
  buildStates(*t);
  if(verbose)
    cerr << source << ": loaded " << t->stateCount() << " states, " << t->transitionCount() << " transitions" << endl;

  indices.clear();
  entries.clear();
  buf = nullptr;
  return t;
}

unique_ptr<OlTransducer>
OlReader::read(const string& path)
{
  FILE* input = fopen(path.c_str(), "rb");
  if(!input)
    throw runtime_error("Transducer not found: '" + path + "'");
  vector<unsigned char> data;
  unsigned char chunk[65536];
  size_t n;
  while((n = fread(chunk, 1, sizeof(chunk), input)) > 0)
    data.insert(data.end(), chunk, chunk + n);
  bool failed = ferror(input);
  fclose(input);
  if(failed)
    throw runtime_error("Error: Cannot read file '" + path + "'");
  return read(data.data(), data.size(), path);
}
