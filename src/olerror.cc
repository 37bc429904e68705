#include "olerror.h"

FormatError::FormatError(const string& source, const string& msg)
  : runtime_error((source.empty() ? string("<buffer>") : source) + ": " + msg), source(source)
{}

CompressedInputError::CompressedInputError(const string& source)
  : FormatError(source, "compressed transducer; decompress it and convert it with "
                        "hfst-fst2fst -O before loading")
{}

UnknownSymbolError::UnknownSymbolError(const string& symbol)
  : runtime_error("Unknown symbol '" + symbol + "'"), sym(symbol)
{}
