#include "icu-iter.h"
#include <stdexcept>
#include <string>
#include <cstdint>
using namespace std;
using namespace icu;

charspan_iter::charspan_iter(const UString &str, int start)
  : _status(U_ZERO_ERROR), s(str.data(), (int32_t)str.size())
{
  it = BreakIterator::createCharacterInstance(Locale::getDefault(), _status);
  if(U_FAILURE(_status))
  {
    delete it;
    throw runtime_error(string("Unable to create character iterator: ") + u_errorName(_status));
  }
  it->setText(s);
  if(start >= s.length())
  {
    _span = make_pair(s.length(), (int)BreakIterator::DONE);
  }
  else
  {
    _span.first = start > 0 ? it->preceding(start + 1) : it->first();
    _span.second = it->following(_span.first);
  }
}

charspan_iter::charspan_iter(const charspan_iter &other)
  : _status(other._status), s(other.s), _span(other._span)
{
  it = other.it->clone();
  it->setText(s);
  if(!at_end())
    it->following(_span.first);
}

charspan_iter::~charspan_iter()
{
  delete it;
}

const UErrorCode &charspan_iter::status() const
{
  return _status;
}

const pair<int, int> &charspan_iter::operator*() const
{
  return _span;
}

charspan_iter &charspan_iter::operator++()
{
  if (!at_end())
  {
    _span = make_pair(_span.second, it->next());
    if(_span.first == _span.second)
      _span.second = it->next();
  }
  return *this;
}

const pair<int, int> &charspan_iter::span() const
{
  return _span;
}

bool charspan_iter::at_end() const
{
  return _span.second == BreakIterator::DONE;
}


unsigned int grapheme_count(const UString &s)
{
  unsigned int n = 0;
  for(charspan_iter cs(s); !cs.at_end(); ++cs)
    n++;
  return n;
}

UString to_ustring(const UnicodeString &str)
{
  UString temp;
  temp.append(str.getBuffer(), (unsigned int)str.length());
  return temp;
}

UString utf8_to_ustring(const char *bytes, size_t len)
{
  return to_ustring(UnicodeString::fromUTF8(StringPiece(bytes, (int32_t)len)));
}

string to_utf8(const UString &str)
{
  string out;
  UnicodeString(str.data(), (int32_t)str.size()).toUTF8String(out);
  return out;
}
