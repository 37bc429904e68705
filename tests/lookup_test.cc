#include "ollookup.h"
#include "olreader.h"
#include "olbuilder.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

static unique_ptr<OlTransducer>
load(OlBuilder& b)
{
  return OlReader().read(b.bytes());
}

static vector<UString>
collapsed(const LookupResult& res)
{
  vector<UString> ret;
  for(auto& r : res.results)
    ret.push_back(r.collapsed);
  sort(ret.begin(), ret.end());
  return ret;
}

// atim -> atim+N+A+Sg and atimw+N+A+Obv
static unique_ptr<OlTransducer>
atimAnalyser()
{
  OlBuilder b;
  unsigned int stem = b.path(0, OlBuilder::chars("atim"));
  b.setFinal(b.path(stem, {{"", "+N"}, {"", "+A"}, {"", "+Sg"}}));
  b.setFinal(b.path(stem, {{"", "w"}, {"", "+N"}, {"", "+A"}, {"", "+Obv"}}));
  return load(b);
}

TEST(Lookup, AnalysesAWord)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  OlLookup lookup(*t);
  LookupResult res = lookup.analyse(u"atim");
  EXPECT_FALSE(res.truncated);
  EXPECT_EQ(collapsed(res), (vector<UString>{u"atim+N+A+Sg", u"atimw+N+A+Obv"}));

  for(auto& r : res.results)
  {
    EXPECT_EQ(r.weight, 0.0);
    OlAnalysis a = OlAnalysis::parse(r);
    if(r.collapsed == u"atim+N+A+Sg")
    {
      EXPECT_TRUE(a.prefixes.empty());
      EXPECT_EQ(a.lemma, u"atim");
      EXPECT_EQ(a.tags(), (vector<UString>{u"N", u"A", u"Sg"}));
      EXPECT_EQ(a.str(), u"atim+N+A+Sg");
    }
    else
    {
      EXPECT_EQ(a.lemma, u"atimw");
    }
  }
}

TEST(Lookup, GeneratesFromTheOutputSide)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  OlLookup lookup(*t);
  LookupResult res = lookup.generate(u"atim+N+A+Sg");
  ASSERT_EQ(res.results.size(), 1u);
  EXPECT_EQ(res.results[0].collapsed, u"atim");
  EXPECT_EQ(res.results[0].weight, 0.0);

  res = lookup.generate(vector<UString>{u"a", u"t", u"i", u"m", u"w", u"+N", u"+A", u"+Obv"});
  ASSERT_EQ(res.results.size(), 1u);
  EXPECT_EQ(res.results[0].collapsed, u"atim");
}

TEST(Lookup, NoMatch)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  OlLookup lookup(*t);
  EXPECT_TRUE(lookup.analyse(u"ati").results.empty());
  EXPECT_TRUE(lookup.analyse(u"atimm").results.empty());
  // z is not in the alphabet and there is no identity symbol
  LookupResult res = lookup.analyse(u"atiz");
  EXPECT_TRUE(res.results.empty());
  EXPECT_FALSE(res.truncated);
  // nor is +Px1Sg
  EXPECT_TRUE(lookup.generate(vector<UString>{u"a", u"+Px1Sg"}).results.empty());
}

TEST(Lookup, InputSymbolsOnlyMatchTheInputSide)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  OlLookup lookup(*t);
  EXPECT_TRUE(lookup.analyse(u"atim+N+A+Sg").results.empty());
}

TEST(Lookup, AccumulatesWeights)
{
  OlBuilder b(true);
  unsigned int s1 = b.addState();
  unsigned int s2 = b.addState(true, 0.25);
  b.arc(0, "a", "b", s1, 0.5);
  b.arc(s1, "c", "d", s2, 1.0);
  unique_ptr<OlTransducer> t = load(b);
  LookupResult res = OlLookup(*t).analyse(u"ac");
  ASSERT_EQ(res.results.size(), 1u);
  EXPECT_EQ(res.results[0].collapsed, u"bd");
  EXPECT_DOUBLE_EQ(res.results[0].weight, 1.75);
}

TEST(Lookup, KeepsTheLightestOfIdenticalPaths)
{
  OlBuilder b(true);
  unsigned int heavy = b.addState(true);
  unsigned int light = b.addState(true);
  b.arc(0, "a", "b", heavy, 2.0);
  b.arc(0, "a", "b", light, 1.0);
  unique_ptr<OlTransducer> t = load(b);
  LookupResult res = OlLookup(*t).analyse(u"a");
  ASSERT_EQ(res.results.size(), 1u);
  EXPECT_DOUBLE_EQ(res.results[0].weight, 1.0);
}

TEST(Lookup, FinalStartStateAcceptsEmptyInput)
{
  for(bool index : {true, false})
  {
    OlBuilder b(true);
    b.setIndexStart(index);
    b.setFinal(0, 0.5);
    b.arc(0, "a", "a", 0);
    unique_ptr<OlTransducer> t = load(b);
    OlLookup lookup(*t);
    LookupResult res = lookup.analyse(u"");
    ASSERT_EQ(res.results.size(), 1u);
    EXPECT_TRUE(res.results[0].symbols.empty());
    EXPECT_DOUBLE_EQ(res.results[0].weight, 0.5);
    res = lookup.analyse(u"aaa");
    ASSERT_EQ(res.results.size(), 1u);
    EXPECT_EQ(res.results[0].collapsed, u"aaa");
  }
}

TEST(Lookup, ReachesStatesInTheIndexTable)
{
  OlBuilder b(true);
  unsigned int mid = b.addState(true, 0.75);
  unsigned int end = b.addState(true, 0.5);
  b.arc(0, "a", "a", mid, 0.25);
  b.arc(mid, "@P.F.V@", "@P.F.V@", end);
  b.arc(mid, "", "x", end, 1);
  b.arc(mid, "b", "b", end);
  b.arc(end, "c", "c", mid);
  b.setIndexed(mid);
  b.setIndexed(end);
  unique_ptr<OlTransducer> t = load(b);
  OlLookup lookup(*t);

  LookupResult res = lookup.analyse(u"a");
  ASSERT_EQ(res.results.size(), 3u);
  for(auto& r : res.results)
  {
    if(r.collapsed == u"ax")
      EXPECT_DOUBLE_EQ(r.weight, 1.75);
    else if(r.symbols.size() == 2)
      EXPECT_DOUBLE_EQ(r.weight, 0.75);
    else
      EXPECT_DOUBLE_EQ(r.weight, 1.0);
  }

  res = lookup.analyse(u"ab");
  ASSERT_EQ(res.results.size(), 1u);
  EXPECT_DOUBLE_EQ(res.results[0].weight, 0.75);

  EXPECT_EQ(collapsed(lookup.analyse(u"acb")), (vector<UString>{u"acb", u"axcb"}));
}

TEST(Lookup, DistinctFlagTrajectoriesAreDistinctResults)
{
  OlBuilder b;
  b.setFinal(b.path(0, {{"@P.X.ONE@", "@P.X.ONE@"}, {"a", "a"}, {"b", "b"}}));
  b.setFinal(b.path(0, {{"@P.X.TWO@", "@P.X.TWO@"}, {"a", "a"}, {"b", "b"}}));
  unique_ptr<OlTransducer> t = load(b);
  LookupResult res = OlLookup(*t).analyse(u"ab");
  ASSERT_EQ(res.results.size(), 2u);
  EXPECT_NE(res.results[0], res.results[1]);
  for(auto& r : res.results)
  {
    EXPECT_EQ(r.collapsed, u"ab");
    EXPECT_EQ(r.symbols.size(), 3u);
    EXPECT_EQ(r.surfaceSymbols, (vector<UString>{u"a", u"b"}));
  }
}

TEST(Lookup, FlagsPruneBranches)
{
  OlBuilder b;
  // R on an unset feature never passes
  b.setFinal(b.path(0, {{"@R.CASE@", "@R.CASE@"}, {"a", "x"}}));
  b.setFinal(b.path(0, {{"a", "y"}}));
  // set then require the same value
  b.setFinal(b.path(0, {{"@P.CASE.NOM@", "@P.CASE.NOM@"}, {"a", "z"}, {"@R.CASE.NOM@", "@R.CASE.NOM@"}}));
  // set then require another value
  b.setFinal(b.path(0, {{"@P.CASE.GEN@", "@P.CASE.GEN@"}, {"a", "w"}, {"@R.CASE.NOM@", "@R.CASE.NOM@"}}));
  // unification conflict
  b.setFinal(b.path(0, {{"@U.CASE.NOM@", "@U.CASE.NOM@"}, {"a", "v"}, {"@U.CASE.GEN@", "@U.CASE.GEN@"}}));
  unique_ptr<OlTransducer> t = load(b);
  EXPECT_EQ(collapsed(OlLookup(*t).analyse(u"a")), (vector<UString>{u"y", u"z"}));
}

TEST(Lookup, FlagsAreCheckedWhenGenerating)
{
  OlBuilder b;
  b.setFinal(b.path(0, {{"@D.NUM@", "@D.NUM@"}, {"x", "a"}}));
  b.setFinal(b.path(0, {{"@P.NUM.PL@", "@P.NUM.PL@"}, {"y", "a"}, {"@D.NUM@", "@D.NUM@"}}));
  unique_ptr<OlTransducer> t = load(b);
  EXPECT_EQ(collapsed(OlLookup(*t).generate(u"a")), (vector<UString>{u"x"}));
}

TEST(Lookup, EpsilonCyclesTerminate)
{
  OlBuilder b;
  unsigned int s1 = b.addState();
  unsigned int s2 = b.addState(true);
  b.arc(0, "", "", s1);
  b.arc(s1, "", "", 0);
  b.arc(0, "@P.F.V@", "@P.F.V@", 0);
  b.arc(0, "", "x", 0);
  b.arc(0, "a", "a", s2);
  unique_ptr<OlTransducer> t = load(b);
  ASSERT_TRUE(t->hasInputEpsilonCycles());

  // the x loop and the eps cycle return to a state already reached at
  // the same input position; only the flag changes anything
  OlLookup lookup(*t);
  LookupResult res = lookup.analyse(u"a");
  EXPECT_FALSE(res.truncated);
  ASSERT_EQ(res.results.size(), 2u);
  for(auto& r : res.results)
    EXPECT_EQ(r.collapsed, u"a");
}

TEST(Lookup, ZeroStepBudget)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  OlLookup lookup(*t);
  LookupLimits limits;
  limits.maxSteps = 0;
  lookup.setLimits(limits);
  LookupResult res = lookup.analyse(u"atim");
  EXPECT_TRUE(res.results.empty());
  EXPECT_TRUE(res.truncated);
}

TEST(Lookup, ZeroResultBudget)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  OlLookup lookup(*t);
  LookupLimits limits;
  limits.maxResults = 0;
  lookup.setLimits(limits);
  LookupResult res = lookup.analyse(u"atim");
  EXPECT_TRUE(res.results.empty());
  EXPECT_TRUE(res.truncated);

  vector<OlResult> seen;
  EXPECT_TRUE(lookup.lookup(u"atim", InputSide, [&](const OlResult& r) {
    seen.push_back(r);
    return true;
  }));
  EXPECT_TRUE(seen.empty());
}

TEST(Lookup, DuplicatePathsDoNotCountAsResults)
{
  OlBuilder b;
  unsigned int s1 = b.addState(true);
  unsigned int s2 = b.addState(true);
  unsigned int s3 = b.addState(true);
  b.arc(0, "a", "b", s1);
  b.arc(0, "a", "b", s2);
  b.arc(0, "a", "c", s3);
  unique_ptr<OlTransducer> t = load(b);
  OlLookup lookup(*t);
  LookupLimits limits;
  limits.maxResults = 2;
  lookup.setLimits(limits);
  LookupResult res = lookup.analyse(u"a");
  EXPECT_FALSE(res.truncated);
  EXPECT_EQ(collapsed(res), (vector<UString>{u"b", u"c"}));

  vector<UString> seen;
  EXPECT_FALSE(lookup.lookup(u"a", InputSide, [&](const OlResult& r) {
    seen.push_back(r.collapsed);
    return true;
  }));
  EXPECT_EQ(seen, (vector<UString>{u"b", u"c"}));
}

TEST(Lookup, StepBudgetStopsLongSearches)
{
  OlBuilder b;
  b.setFinal(0);
  for(const char* c : {"a", "b", "c", "d"})
    b.arc(0, c, c, 0);
  unique_ptr<OlTransducer> t = load(b);
  OlLookup lookup(*t);
  LookupLimits limits;
  limits.maxSteps = 5;
  lookup.setLimits(limits);
  EXPECT_TRUE(lookup.analyse(u"abcdabcdabcd").truncated);
  limits.maxSteps = 1000;
  lookup.setLimits(limits);
  LookupResult res = lookup.analyse(u"abcdabcdabcd");
  EXPECT_FALSE(res.truncated);
  EXPECT_EQ(res.results.size(), 1u);
}

TEST(Lookup, ResultLimit)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  OlLookup lookup(*t);
  LookupLimits limits;
  limits.maxResults = 1;
  lookup.setLimits(limits);
  EXPECT_EQ(lookup.getLimits().maxResults, 1);
  LookupResult res = lookup.analyse(u"atim");
  EXPECT_EQ(res.results.size(), 1u);
  EXPECT_TRUE(res.truncated);

  limits.maxResults = 2;
  lookup.setLimits(limits);
  res = lookup.analyse(u"atim");
  EXPECT_EQ(res.results.size(), 2u);
}

TEST(Lookup, VisitorCanStopEarly)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  OlLookup lookup(*t);
  vector<OlResult> seen;
  bool truncated = lookup.lookup(u"atim", InputSide, [&](const OlResult& r) {
    seen.push_back(r);
    return false;
  });
  EXPECT_FALSE(truncated);
  EXPECT_EQ(seen.size(), 1u);

  seen.clear();
  lookup.lookup(u"atim", InputSide, [&](const OlResult& r) {
    seen.push_back(r);
    return true;
  });
  EXPECT_EQ(seen.size(), 2u);
}

TEST(Lookup, IdentityEchoesUnknownInput)
{
  OlBuilder b;
  b.setFinal(0);
  b.arc(0, "a", "A", 0);
  b.arc(0, "@_IDENTITY_SYMBOL_@", "@_IDENTITY_SYMBOL_@", 0);
  unique_ptr<OlTransducer> t = load(b);
  OlLookup lookup(*t);
  LookupResult res = lookup.analyse(u"axa");
  ASSERT_EQ(res.results.size(), 1u);
  EXPECT_EQ(res.results[0].collapsed, u"AxA");
  EXPECT_EQ(res.results[0].symbols, (vector<UString>{u"A", u"x", u"A"}));

  res = lookup.analyse(u"\u00e9");
  ASSERT_EQ(res.results.size(), 1u);
  EXPECT_EQ(res.results[0].collapsed, u"\u00e9");
}

TEST(Lookup, UnknownMapsToAFixedOutput)
{
  OlBuilder b;
  unsigned int end = b.addState(true);
  b.arc(0, "@_UNKNOWN_SYMBOL_@", "?", end);
  unique_ptr<OlTransducer> t = load(b);
  LookupResult res = OlLookup(*t).analyse(u"q");
  ASSERT_EQ(res.results.size(), 1u);
  EXPECT_EQ(res.results[0].collapsed, u"?");
}

TEST(Lookup, RepeatedQueriesAgree)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  OlLookup lookup(*t);
  LookupResult first = lookup.analyse(u"atim");
  for(int i = 0; i < 5; i++)
  {
    LookupResult again = lookup.analyse(u"atim");
    ASSERT_EQ(again.results.size(), first.results.size());
    for(size_t k = 0; k < first.results.size(); k++)
    {
      EXPECT_EQ(again.results[k].symbols, first.results[k].symbols);
      EXPECT_EQ(again.results[k].weight, first.results[k].weight);
    }
  }
}

TEST(Lookup, ConcurrentQueries)
{
  unique_ptr<OlTransducer> t = atimAnalyser();
  const OlLookup lookup(*t);
  vector<UString> expected = collapsed(lookup.analyse(u"atim"));
  vector<int> failures(8, 0);
  vector<thread> threads;
  for(int i = 0; i < 8; i++)
  {
    threads.push_back(thread([&, i]() {
      for(int k = 0; k < 200; k++)
      {
        if(collapsed(lookup.analyse(u"atim")) != expected)
          failures[i]++;
        if(lookup.generate(u"atim+N+A+Sg").results.size() != 1)
          failures[i]++;
      }
    }));
  }
  for(auto& th : threads)
    th.join();
  for(int f : failures)
    EXPECT_EQ(f, 0);
}

TEST(Lookup, Strings)
{
  OlBuilder b(true);
  unsigned int end = b.addState(true);
  b.arc(0, "a", "heavy", end, 3);
  b.arc(0, "a", "light", end, 1);
  b.arc(0, "b", "b", end, 0);
  unique_ptr<OlTransducer> t = load(b);
  OlLookup lookup(*t);
  EXPECT_EQ(lookup.lookupStrings(u"a"), (vector<UString>{u"light", u"heavy"}));

  map<UString, set<UString>> bulk = lookup.bulkLookup({u"a", u"b", u"c"});
  ASSERT_EQ(bulk.size(), 3u);
  EXPECT_EQ(bulk[u"a"], (set<UString>{u"heavy", u"light"}));
  EXPECT_EQ(bulk[u"b"], (set<UString>{u"b"}));
  EXPECT_TRUE(bulk[u"c"].empty());
}
