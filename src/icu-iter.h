#ifndef _OLOOKUP_ICU_ITER_H_
#define _OLOOKUP_ICU_ITER_H_

#include <unicode/brkiter.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/ustring.h>
#include <lttoolbox/ustring.h>
#include <string>
#include <utility>

// Forward iteration over the grapheme clusters of a string, as
// [first, second) spans of UTF-16 offsets.
class charspan_iter
{
  private:
    icu::BreakIterator* it;
    UErrorCode _status;
    icu::UnicodeString s;
    std::pair<int, int> _span;
  public:
    charspan_iter(const UString &str, int start = 0);
    charspan_iter(const charspan_iter &other);
    charspan_iter &operator=(const charspan_iter &) = delete;
    ~charspan_iter();

    const UErrorCode &status() const;
    const std::pair<int, int> &operator*() const;
    charspan_iter &operator++();
    const std::pair<int, int> &span() const;
    // checks whether the iterator has run past the last cluster
    bool at_end() const;
};

// number of user-perceived characters in s
unsigned int grapheme_count(const UString &s);

UString to_ustring(const icu::UnicodeString &str);
UString utf8_to_ustring(const char *bytes, size_t len);
std::string to_utf8(const UString &str);

#endif
