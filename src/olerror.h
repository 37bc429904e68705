#ifndef __OLERROR__
#define __OLERROR__

#include <stdexcept>
#include <string>

using namespace std;

class FormatError : public runtime_error
{
private:
  string source;
public:
  FormatError(const string& source, const string& msg);
  const string& filename() const
  {
    return source;
  }
};

// The input is a compressed container (gzip, as written by foma) that has
// to be decompressed and converted before it can be loaded.
class CompressedInputError : public FormatError
{
public:
  explicit CompressedInputError(const string& source);
};

class UnknownSymbolError : public runtime_error
{
private:
  string sym;
public:
  explicit UnknownSymbolError(const string& symbol);
  const string& symbol() const
  {
    return sym;
  }
};

#endif
