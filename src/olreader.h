#ifndef __OLREADER__
#define __OLREADER__

#include "oltransducer.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace std;

// Reader for HFST optimized-lookup transducers (HFST_OL and HFST_OLW),
// with or without the HFST3 container header.
class OlReader
{
private:
  struct index_entry_t {
    uint16_t input;
    uint32_t target;
  };
  struct trans_entry_t {
    uint16_t input;
    uint16_t output;
    uint32_t target;
    float weight;
  };

  bool verbose = false;

  string source;
  const unsigned char* buf = nullptr;
  size_t len = 0;
  size_t pos = 0;

  unsigned int inputSymbols = 0;
  unsigned int symbolCount = 0;
  uint32_t indexSize = 0;
  uint32_t targetSize = 0;
  vector<sym_t> fileToCode;
  vector<bool> zeroWidth;
  vector<index_entry_t> indices;
  vector<trans_entry_t> entries;

  void die(const string& msg);
  void need(size_t n, const char* what);
  uint16_t read_u16();
  uint32_t read_u32();
  float read_f32();

  void checkMagic();
  void readContainerHeader(OlTransducer& t);
  void readHeader(OlTransducer& t);
  void readSymbols(OlTransducer& t);
  void readTables(bool weighted);
  sym_t symbol(uint32_t number, const char* side);
  void readState(uint32_t address, OlState& st, vector<uint32_t>& arcs, bool weighted);
  void buildStates(OlTransducer& t);

public:
  void setVerbose(bool val)
  {
    verbose = val;
  }
  unique_ptr<OlTransducer> read(const string& path);
  unique_ptr<OlTransducer> read(const unsigned char* data, size_t size, const string& name = "");
  unique_ptr<OlTransducer> read(const vector<unsigned char>& data, const string& name = "")
  {
    return read(data.data(), data.size(), name);
  }
};

#endif
