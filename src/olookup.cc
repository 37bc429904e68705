#include "olreader.h"
#include "ollookup.h"
#include "olpair.h"
#include "olerror.h"

#include <lttoolbox/lt_locale.h>
#include <lttoolbox/string_utils.h>
#include <unicode/ustdio.h>
#include <unicode/uchar.h>
#include <libgen.h>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

using namespace std;

void endProgram(char *name)
{
  if(name != NULL)
  {
    cout << basename(name) << ": look up words in optimized-lookup transducers" << endl;
    cout << "USAGE: " << basename(name) << " [-aivx] [-g generator] [-n steps] [-r results] [-t seconds] transducer" << endl;
    cout << "   -a, --att:          print the transducer in AT&T format and exit" << endl;
    cout << "   -g, --generator:    pair with a generator and print standardized forms" << endl;
    cout << "   -i, --inverse:      generate (match the output side) instead of analysing" << endl;
    cout << "   -n, --max-steps:    stop each search after this many steps" << endl;
    cout << "   -r, --max-results:  stop each search after this many results" << endl;
    cout << "   -t, --time-cutoff:  stop each search after this many seconds (default 60, 0 = none)" << endl;
    cout << "   -v, --verbose:      report loading and search progress on stderr" << endl;
    cout << "   -x, --statistics:   print transducer sizes to stderr" << endl;
  }
  exit(EXIT_FAILURE);
}

void printResult(const UString& input, const OlResult& r, const UString* standardized)
{
  cout << input << "\t" << r.collapsed << "\t" << r.weight;
  if(standardized != nullptr)
    cout << "\t" << *standardized;
  cout << endl;
}

void printUnknown(const UString& input)
{
  cout << input << "\t" << input << "+?\tinf" << endl;
}

// one line of input without its newline or surrounding whitespace;
// false at end of input
bool readLine(UFILE* input, UString& line)
{
  line.clear();
  UChar c;
  bool any = false;
  while((c = u_fgetc(input)) != '\n')
  {
    if(c == U_EOF)
      break;
    any = true;
    line += c;
  }
  if(!any && c == U_EOF)
    return false;
  size_t b = 0;
  while(b < line.size() && u_isWhitespace(line[b]))
    b++;
  size_t e = line.size();
  while(e > b && u_isWhitespace(line[e-1]))
    e--;
  line = line.substr(b, e - b);
  return true;
}

int main(int argc, char *argv[])
{
  bool att = false;
  bool inverse = false;
  bool stats = false;
  bool verbose = false;
  string generatorFile;
  LookupLimits limits;

  LtLocale::tryToSetLocale();

#if HAVE_GETOPT_LONG
  int option_index=0;
#endif

  while (true) {
#if HAVE_GETOPT_LONG
    static struct option long_options[] =
    {
      {"att",         no_argument,       0, 'a'},
      {"generator",   required_argument, 0, 'g'},
      {"help",        no_argument,       0, 'h'},
      {"inverse",     no_argument,       0, 'i'},
      {"max-steps",   required_argument, 0, 'n'},
      {"max-results", required_argument, 0, 'r'},
      {"time-cutoff", required_argument, 0, 't'},
      {"verbose",     no_argument,       0, 'v'},
      {"statistics",  no_argument,       0, 'x'},
      {0, 0, 0, 0}
    };

    int cnt=getopt_long(argc, argv, "ag:hin:r:t:vx", long_options, &option_index);
#else
    int cnt=getopt(argc, argv, "ag:hin:r:t:vx");
#endif
    if (cnt==-1)
      break;

    switch (cnt)
    {
      case 'a':
        att = true;
        break;

      case 'g':
        generatorFile = optarg;
        break;

      case 'i':
        inverse = true;
        break;

      case 'n':
        limits.maxSteps = StringUtils::stoi(to_ustring(optarg));
        break;

      case 'r':
        limits.maxResults = StringUtils::stoi(to_ustring(optarg));
        break;

      case 't':
        limits.timeCutoff = StringUtils::stod(to_ustring(optarg));
        break;

      case 'v':
        verbose = true;
        break;

      case 'x':
        stats = true;
        break;

      case 'h': // fallthrough
      default:
        endProgram(argv[0]);
        break;
    }
  }

  if(argc - optind != 1)
    endProgram(argv[0]);
  string infile = argv[optind];

  unique_ptr<OlTransducer> fst;
  unique_ptr<OlTransducer> gen;
  try
  {
    OlReader reader;
    reader.setVerbose(verbose);
    fst = reader.read(infile);
    if(!generatorFile.empty())
      gen = reader.read(generatorFile);
  }
  catch(const CompressedInputError& e)
  {
    cerr << "Error: " << e.what() << endl;
    cerr << "Decompress '" << e.filename() << "' and try again." << endl;
    exit(EXIT_FAILURE);
  }
  catch(const exception& e)
  {
    cerr << "Error: " << e.what() << endl;
    exit(EXIT_FAILURE);
  }

  if(stats)
    fst->printStatistics();
  if(fst->hasInputEpsilonCycles())
    cerr << "WARNING: " << infile << " is infinitely ambiguous." << endl;

  if(att)
  {
    Alphabet alphabet;
    Transducer* transducer = fst->toLttoolbox(alphabet);
    transducer->show(alphabet, stdout, 0, true);
    delete transducer;
    return 0;
  }

  unique_ptr<OlPair> paired;
  unique_ptr<OlLookup> lookup;
  if(gen)
  {
    paired.reset(new OlPair(move(fst), move(gen)));
    paired->setLimits(limits);
    paired->setVerbose(verbose);
  }
  else
  {
    lookup.reset(new OlLookup(*fst));
    lookup->setLimits(limits);
    lookup->setVerbose(verbose);
  }

  UFILE* in = u_finit(stdin, NULL, NULL);
  UString input;
  while(readLine(in, input))
  {
    if(input.empty())
      continue;
    bool any = false;
    bool truncated = false;
    if(paired && inverse)
    {
      LookupResult res = paired->generate(input);
      sortResults(res.results);
      for(auto& r : res.results)
      {
        printResult(input, r, nullptr);
        any = true;
      }
      truncated = res.truncated;
    }
    else if(paired)
    {
      PairAnalysis res = paired->analyse(input);
      for(auto& fa : res.results)
      {
        UString standard = fa.standardized ? *fa.standardized : UString();
        printResult(input, fa.result, &standard);
        any = true;
      }
      truncated = res.truncated;
    }
    else
    {
      LookupResult res = lookup->lookup(input, inverse ? OutputSide : InputSide);
      sortResults(res.results);
      for(auto& r : res.results)
      {
        printResult(input, r, nullptr);
        any = true;
      }
      truncated = res.truncated;
    }
    if(truncated)
      cerr << "WARNING: search for '" << input << "' was cut short" << endl;
    if(!any)
      printUnknown(input);
    cout << endl;
  }
  u_fclose(in);
  return 0;
}
