#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include "Transition.hh"
#include "PinState.hh"
#include "CellTopology.hh"
#include "CharError.hh"
#include "StringUtil.hh"
#include "Harness.hh"

namespace cchar {

typedef std::unique_ptr<Harness> HarnessPtr;

static SequentialHarness *
sequential(const HarnessPtr &harness)
{
  return dynamic_cast<SequentialHarness*>(harness.get());
}

class HarnessTest : public ::testing::Test {
protected:
  HarnessTest() :
    inv_("INV"),
    nand2_("NAND2"),
    xor2_("XOR2"),
    dffr_("DFFR"),
    dffrs_("DFFRS")
  {
  }

  void SetUp() override {
    inv_.addInPort("A");
    inv_.addOutPort("Y");
    inv_.setSlews({0.1f, 0.5f});
    inv_.setLoads({1.0f, 2.0f, 4.0f});

    nand2_.addInPort("A");
    nand2_.addInPort("B");
    nand2_.addOutPort("Y");
    nand2_.setSlews({0.1f});
    nand2_.setLoads({1.0f});

    xor2_.addInPort("A");
    xor2_.addInPort("B");
    xor2_.addOutPort("Y");
    xor2_.setSlews({0.1f});
    xor2_.setLoads({1.0f});

    // clock, reset, flops, inputs, outputs
    dffr_.addInPort("D");
    dffr_.addOutPort("Q");
    dffr_.setClock("CLK");
    dffr_.setReset("R");
    dffr_.addFlop("IQ");
    dffr_.setSlews({0.1f, 0.2f});
    dffr_.setLoads({1.0f});

    // clock, reset, set, flops, inputs, outputs
    dffrs_.addInPort("D");
    dffrs_.addOutPort("Q");
    dffrs_.addOutPort("QN");
    dffrs_.setClock("CLK");
    dffrs_.setReset("R");
    dffrs_.setSet("S");
    dffrs_.addFlop("IQ");
    dffrs_.addFlop("IQN");
    dffrs_.setSlews({0.1f});
    dffrs_.setLoads({1.0f});
  }

  CellTopology inv_;
  CellTopology nand2_;
  CellTopology xor2_;
  CellTopology dffr_;
  CellTopology dffrs_;
};

////////////////////////////////////////////////////////////////
// Combinational construction
////////////////////////////////////////////////////////////////

TEST_F(HarnessTest, Inverter)
{
  HarnessPtr harness(makeHarness(&inv_, {"01", "10"}));
  EXPECT_EQ(harness->kind(), HarnessKind::combinational);
  EXPECT_FALSE(harness->isSequential());
  EXPECT_STREQ(harness->cellName(), "INV");
  EXPECT_EQ(harness->targetInPort().pin(), "A");
  EXPECT_EQ(harness->targetOutPort().pin(), "Y");
  EXPECT_EQ(harness->inDirection(), RiseFall::rise());
  EXPECT_EQ(harness->outDirection(), RiseFall::fall());
  EXPECT_TRUE(harness->stableInPorts().empty());
  EXPECT_TRUE(harness->nontargetOutPorts().empty());
  EXPECT_STREQ(harness->timingSense(), "negative_unate");
  EXPECT_EQ(harness->arcString(), "A (rise) -> Y (fall)");
}

TEST_F(HarnessTest, AndGateFirstInputTarget)
{
  HarnessPtr harness(makeHarness(&nand2_, {"01", "1", "01"}));
  EXPECT_EQ(harness->targetInPort().pin(), "A");
  EXPECT_EQ(harness->inDirection(), RiseFall::rise());
  EXPECT_EQ(harness->outDirection(), RiseFall::rise());
  ASSERT_EQ(harness->stableInPorts().size(), 1u);
  EXPECT_EQ(harness->stableInPorts()[0].pin(), "B");
  EXPECT_EQ(harness->stableInPorts()[0].state(), PinState::one());
  EXPECT_EQ(harness->stableInPorts()[0].direction(), nullptr);
  EXPECT_STREQ(harness->timingSense(), "positive_unate");
}

TEST_F(HarnessTest, AndGateSecondInputTarget)
{
  HarnessPtr harness(makeHarness(&nand2_, {"1", "01", "01"}));
  EXPECT_EQ(harness->targetInPort().pin(), "B");
  ASSERT_EQ(harness->stableInPorts().size(), 1u);
  EXPECT_EQ(harness->stableInPorts()[0].pin(), "A");
  EXPECT_EQ(harness->stableInPorts()[0].state()->code(), "1");
}

TEST_F(HarnessTest, PortCountsSum)
{
  HarnessPtr harness(makeHarness(&dffrs_, {"01", "0", "0", "0", "1",
                                           "01", "01", "0"}));
  EXPECT_EQ(harness->stableInPorts().size() + 1, dffrs_.inPorts().size());
  EXPECT_EQ(harness->nontargetOutPorts().size() + 1, dffrs_.outPorts().size());
}

TEST_F(HarnessTest, TriStateTargets)
{
  HarnessPtr harness(makeHarness(&inv_, {"Z1", "z0"}));
  EXPECT_EQ(harness->inDirection(), RiseFall::rise());
  EXPECT_EQ(harness->outDirection(), RiseFall::fall());
  EXPECT_EQ(harness->targetInPort().state(), PinState::triRise());
}

TEST_F(HarnessTest, ResultTableCoversGrid)
{
  HarnessPtr harness(makeHarness(&inv_, {"01", "10"}));
  const ResultTable &results = harness->results();
  EXPECT_EQ(results.slewCount(), 2u);
  EXPECT_EQ(results.loadCount(), 3u);
  EXPECT_EQ(results.size(), 6u);
  for (size_t si = 0; si < results.slewCount(); si++) {
    for (size_t li = 0; li < results.loadCount(); li++)
      EXPECT_TRUE(results.values(si, li).empty());
  }
}

TEST_F(HarnessTest, ShortStringRoundTrip)
{
  HarnessPtr harness(makeHarness(&nand2_, {"01", "1", "10"}));
  EXPECT_EQ(harness->shortString(), "A=01 B=1 Y=10");
  EXPECT_EQ(harness->testVector(), StringSeq({"01", "1", "10"}));
  HarnessPtr harness2(makeHarness(&nand2_, {"0", "10", "01"}));
  EXPECT_EQ(harness2->shortString(), "B=10 A=0 Y=01");
}

TEST_F(HarnessTest, AsString)
{
  HarnessPtr harness(makeHarness(&nand2_, {"01", "1", "10"}));
  EXPECT_EQ(harness->asString(),
            "Arc Under Test: A (rise) -> Y (fall)\n"
            "    Stable Input Ports:\n"
            "        B: 1");
}

////////////////////////////////////////////////////////////////
// Malformed vectors
////////////////////////////////////////////////////////////////

TEST_F(HarnessTest, MissingOutputTarget)
{
  try {
    delete makeHarness(&nand2_, {"01", "1", "1"});
    FAIL() << "no exception for vector without output target";
  }
  catch (MalformedTestVectorError &error) {
    EXPECT_EQ(error.testVector(), StringSeq({"01", "1", "1"}));
    EXPECT_NE(std::string(error.what()).find("[01 1 1]"), std::string::npos);
    EXPECT_EQ(error.reason(), "no target output transition");
  }
}

TEST_F(HarnessTest, MissingInputTarget)
{
  EXPECT_THROW(delete makeHarness(&nand2_, {"0", "1", "10"}),
               MalformedTestVectorError);
}

TEST_F(HarnessTest, ArityMismatch)
{
  EXPECT_THROW(delete makeHarness(&inv_, {"01"}), MalformedTestVectorError);
  EXPECT_THROW(delete makeHarness(&inv_, {"01", "10", "1"}),
               MalformedTestVectorError);
  EXPECT_THROW(delete makeHarness(&dffr_, {"01", "01", "0", "10"}),
               MalformedTestVectorError);
}

TEST_F(HarnessTest, MultipleTargets)
{
  EXPECT_THROW(delete makeHarness(&nand2_, {"01", "10", "10"}),
               MalformedTestVectorError);
  EXPECT_THROW(delete makeHarness(&dffrs_, {"01", "0", "0", "0", "1",
                                            "01", "01", "10"}),
               MalformedTestVectorError);
}

TEST_F(HarnessTest, UnknownCode)
{
  EXPECT_THROW(delete makeHarness(&inv_, {"0x", "10"}),
               MalformedTestVectorError);
  EXPECT_THROW(delete makeHarness(&inv_, {"01", "R"}),
               MalformedTestVectorError);
}

TEST_F(HarnessTest, PulseOnDataPin)
{
  EXPECT_THROW(delete makeHarness(&inv_, {"0101", "10"}),
               MalformedTestVectorError);
}

////////////////////////////////////////////////////////////////
// Sequential construction and classification
////////////////////////////////////////////////////////////////

TEST_F(HarnessTest, SequentialDataTarget)
{
  HarnessPtr harness(makeHarness(&dffr_, {"01", "0", "0", "01", "01"}));
  SequentialHarness *seq = sequential(harness);
  ASSERT_NE(seq, nullptr);
  EXPECT_TRUE(seq->isSequential());
  EXPECT_EQ(seq->clock().pin(), "CLK");
  EXPECT_EQ(seq->clock().state(), PinState::rise());
  EXPECT_EQ(seq->reset().pin(), "R");
  EXPECT_TRUE(seq->set().isNull());
  EXPECT_FALSE(seq->targetsSetReset());
  EXPECT_EQ(seq->targetInPort().pin(), "D");
  ASSERT_EQ(seq->flopStates().size(), 1u);
  EXPECT_EQ(seq->flops()[0], "IQ");
  EXPECT_EQ(seq->flopStates()[0], PinState::zero());
  EXPECT_EQ(seq->shortString(), "CLK=01 D=01 Q=01 R=0 IQ=0");
}

TEST_F(HarnessTest, SetupHoldLabels)
{
  HarnessPtr rise(makeHarness(&dffr_, {"01", "0", "0", "01", "01"}));
  HarnessPtr fall(makeHarness(&dffr_, {"01", "0", "1", "10", "10"}));
  EXPECT_EQ(sequential(rise)->timingTypeSetup(), "setup_rising");
  EXPECT_EQ(sequential(rise)->timingTypeHold(), "hold_rising");
  EXPECT_EQ(sequential(fall)->timingTypeSetup(), "setup_falling");
  EXPECT_EQ(sequential(fall)->timingTypeHold(), "hold_falling");
  EXPECT_EQ(sequential(rise)->timingSenseConstraint(), "rise_constraint");
  EXPECT_EQ(sequential(fall)->timingSenseConstraint(), "fall_constraint");
  EXPECT_EQ(sequential(rise)->timingWhen(), "D");
  EXPECT_EQ(sequential(fall)->timingWhen(), "!D");
}

TEST_F(HarnessTest, ClockEdgeLabels)
{
  HarnessPtr rising(makeHarness(&dffr_, {"01", "0", "0", "01", "01"}));
  HarnessPtr pulse_rise(makeHarness(&dffr_, {"1010", "0", "0", "01", "01"}));
  HarnessPtr pulse_fall(makeHarness(&dffr_, {"0101", "0", "0", "01", "01"}));
  EXPECT_EQ(sequential(rising)->timingTypeClock(), "rising_edge");
  EXPECT_EQ(sequential(pulse_rise)->timingTypeClock(), "rising_edge");
  EXPECT_EQ(sequential(pulse_fall)->timingTypeClock(), "falling_edge");
}

TEST_F(HarnessTest, DataTargetRejectsRecovery)
{
  HarnessPtr harness(makeHarness(&dffr_, {"01", "0", "0", "01", "01"}));
  EXPECT_THROW(sequential(harness)->timingTypeRecovery(), ClassificationError);
  EXPECT_THROW(sequential(harness)->timingTypeRemoval(), ClassificationError);
}

TEST_F(HarnessTest, ResetTarget)
{
  HarnessPtr harness(makeHarness(&dffr_, {"01", "01", "1", "0", "10"}));
  SequentialHarness *seq = sequential(harness);
  ASSERT_NE(seq, nullptr);
  EXPECT_TRUE(seq->targetsSetReset());
  EXPECT_EQ(seq->targetInPort().pin(), "R");
  EXPECT_EQ(seq->resetDirection(), RiseFall::rise());
  ASSERT_EQ(seq->stableInPorts().size(), 1u);
  EXPECT_EQ(seq->stableInPorts()[0].pin(), "D");
  EXPECT_EQ(seq->shortString(), "CLK=01 R=01 D=0 Q=10 IQ=1");
}

TEST_F(HarnessTest, ResetTargetRejectsSetup)
{
  HarnessPtr harness(makeHarness(&dffr_, {"01", "01", "1", "0", "10"}));
  SequentialHarness *seq = sequential(harness);
  try {
    seq->timingTypeSetup();
    FAIL() << "setup classified on a reset target";
  }
  catch (ClassificationError &error) {
    EXPECT_EQ(error.mode(), "setup");
  }
  EXPECT_THROW(seq->timingTypeHold(), ClassificationError);
  EXPECT_THROW(seq->timingTypeClock(), ClassificationError);
}

TEST_F(HarnessTest, RecoveryRemovalLabels)
{
  HarnessPtr rise(makeHarness(&dffr_, {"01", "01", "1", "0", "10"}));
  HarnessPtr fall(makeHarness(&dffr_, {"01", "10", "1", "0", "10"}));
  EXPECT_EQ(sequential(rise)->timingTypeRecovery(), "recovery_rising");
  EXPECT_EQ(sequential(rise)->timingTypeRemoval(), "removal_falling");
  EXPECT_EQ(sequential(fall)->timingTypeRecovery(), "recovery_falling");
  EXPECT_EQ(sequential(fall)->timingTypeRemoval(), "removal_rising");
}

TEST_F(HarnessTest, SetTargetWithReset)
{
  // CLK R S IQ IQN D Q QN
  HarnessPtr harness(makeHarness(&dffrs_, {"01", "0", "01", "0", "1",
                                           "0", "01", "0"}));
  SequentialHarness *seq = sequential(harness);
  EXPECT_EQ(seq->targetInPort().pin(), "S");
  EXPECT_EQ(seq->setDirection(), RiseFall::rise());
  EXPECT_EQ(seq->resetDirection(), nullptr);
  EXPECT_EQ(seq->flopStates()[1], PinState::one());
  EXPECT_EQ(seq->shortString(), "CLK=01 S=01 D=0 Q=01 QN=0 R=0 IQ=0 IQN=1");
  EXPECT_EQ(seq->timingTypeRecovery(), "recovery_rising");
}

TEST_F(HarnessTest, SetAndDataTargets)
{
  EXPECT_THROW(delete makeHarness(&dffr_, {"01", "01", "0", "01", "10"}),
               MalformedTestVectorError);
}

TEST_F(HarnessTest, SequentialNoInputTarget)
{
  try {
    delete makeHarness(&dffr_, {"01", "0", "0", "1", "10"});
    FAIL() << "no exception for sequential vector without input target";
  }
  catch (MalformedTestVectorError &error) {
    EXPECT_NE(error.reason().find("set or reset"), std::string::npos);
  }
}

TEST_F(HarnessTest, SequentialAsString)
{
  HarnessPtr harness(makeHarness(&dffr_, {"01", "0", "0", "01", "01"}));
  std::string str = harness->asString();
  EXPECT_EQ(str.find("Arc Under Test: D (rise) -> Q (rise)"), 0u);
  EXPECT_NE(str.find("Clock: CLK: 01"), std::string::npos);
  EXPECT_NE(str.find("Reset: R: 0"), std::string::npos);
  EXPECT_EQ(str.find("Set:"), std::string::npos);
  EXPECT_NE(str.find("Flop States:\n        IQ: 0"), std::string::npos);
}

TEST_F(HarnessTest, SequentialShortStringRoundTrip)
{
  // CLK R IQ D Q
  StringSeq ports = {"CLK", "R", "IQ", "D", "Q"};
  StringSeq vector = {"01", "0", "1", "01", "01"};
  HarnessPtr harness(makeHarness(&dffr_, vector));
  StringSeq bindings;
  split(harness->shortString(), " ", bindings);
  ASSERT_EQ(bindings.size(), ports.size());
  std::map<std::string, std::string> states;
  for (const std::string &binding : bindings) {
    size_t eq = binding.find('=');
    ASSERT_NE(eq, std::string::npos);
    states[binding.substr(0, eq)] = binding.substr(eq + 1);
  }
  for (size_t i = 0; i < ports.size(); i++)
    EXPECT_EQ(states[ports[i]], vector[i]) << ports[i];
}

TEST_F(HarnessTest, FlopStatesDistinguishHarnesses)
{
  HarnessPtr low(makeHarness(&dffr_, {"01", "0", "0", "01", "01"}));
  HarnessPtr high(makeHarness(&dffr_, {"01", "0", "1", "01", "01"}));
  EXPECT_NE(low->shortString(), high->shortString());
  EXPECT_EQ(high->shortString(), "CLK=01 D=01 Q=01 R=0 IQ=1");
}

TEST(TimingCheckModeTest, Names)
{
  EXPECT_STREQ(timingCheckModeName(TimingCheckMode::removal), "removal");
  EXPECT_EQ(timingCheckModeNames(), "hold setup recovery removal clock");
  TimingCheckMode mode;
  bool exists;
  findTimingCheckMode("recovery", mode, exists);
  EXPECT_TRUE(exists);
  EXPECT_EQ(mode, TimingCheckMode::recovery);
  findTimingCheckMode("skew", mode, exists);
  EXPECT_FALSE(exists);
}

////////////////////////////////////////////////////////////////
// Harness summaries
////////////////////////////////////////////////////////////////

TEST_F(HarnessTest, PropagationDelaySummary)
{
  HarnessPtr harness(makeHarness(&inv_, {"01", "10"}));
  EXPECT_THROW(harness->averagePropagationDelay(), GridLookupError);
  EXPECT_THROW(harness->maxPropagationDelay(), GridLookupError);
  ResultTable &results = harness->results();
  results.setValue(0, 0, Metric::prop_in_out, 1e-11);
  results.setValue(0, 1, Metric::prop_in_out, 3e-11);
  results.setValue(1, 2, Metric::prop_in_out, 5e-11);
  EXPECT_DOUBLE_EQ(harness->averagePropagationDelay(), 3e-11);
  EXPECT_DOUBLE_EQ(harness->maxPropagationDelay(), 5e-11);
}

TEST_F(HarnessTest, InputCapacitanceSummary)
{
  HarnessPtr harness(makeHarness(&inv_, {"01", "10"}));
  ResultTable &results = harness->results();
  EXPECT_THROW(harness->averageInputCapacitance(), GridLookupError);
  double cap = 1e-15;
  for (size_t si = 0; si < results.slewCount(); si++) {
    for (size_t li = 0; li < results.loadCount(); li++) {
      results.setValue(si, li, Metric::input_capacitance, cap);
      cap += 1e-15;
    }
  }
  EXPECT_NEAR(harness->averageInputCapacitance(), 3.5e-15, 1e-21);
}

////////////////////////////////////////////////////////////////
// Harness collections
////////////////////////////////////////////////////////////////

class HarnessListTest : public HarnessTest {
protected:
  void TearDown() override {
    for (Harness *harness : harnesses_)
      delete harness;
  }

  HarnessSeq harnesses_;
};

TEST_F(HarnessListTest, FilterByPorts)
{
  harnesses_.push_back(makeHarness(&nand2_, {"01", "1", "10"}));
  harnesses_.push_back(makeHarness(&nand2_, {"1", "01", "10"}));
  harnesses_.push_back(makeHarness(&nand2_, {"10", "1", "01"}));
  HarnessSeq a_y = filterHarnessesByPorts(harnesses_, "A", "Y");
  ASSERT_EQ(a_y.size(), 2u);
  EXPECT_EQ(a_y[0], harnesses_[0]);
  EXPECT_EQ(a_y[1], harnesses_[2]);
  EXPECT_TRUE(filterHarnessesByPorts(harnesses_, "A", "Z").empty());
}

TEST_F(HarnessListTest, FindByArc)
{
  harnesses_.push_back(makeHarness(&nand2_, {"01", "1", "10"}));
  harnesses_.push_back(makeHarness(&nand2_, {"10", "1", "01"}));
  EXPECT_EQ(findHarnessByArc(harnesses_, "A", "Y", RiseFall::fall()),
            harnesses_[0]);
  EXPECT_EQ(findHarnessByArc(harnesses_, "A", "Y", RiseFall::rise()),
            harnesses_[1]);
}

TEST_F(HarnessListTest, FindByArcNoneFound)
{
  harnesses_.push_back(makeHarness(&nand2_, {"01", "1", "10"}));
  try {
    findHarnessByArc(harnesses_, "B", "Y", RiseFall::fall());
    FAIL() << "no exception for missing arc";
  }
  catch (GridLookupError &error) {
    EXPECT_EQ(error.failure(), LookupFailure::none_found);
  }
}

TEST_F(HarnessListTest, FindByArcAmbiguous)
{
  harnesses_.push_back(makeHarness(&nand2_, {"01", "1", "10"}));
  harnesses_.push_back(makeHarness(&nand2_, {"z1", "1", "10"}));
  try {
    findHarnessByArc(harnesses_, "A", "Y", RiseFall::fall());
    FAIL() << "no exception for ambiguous arc";
  }
  catch (GridLookupError &error) {
    EXPECT_EQ(error.failure(), LookupFailure::ambiguous);
  }
}

TEST_F(HarnessListTest, TimingSenseUnate)
{
  harnesses_.push_back(makeHarness(&inv_, {"01", "10"}));
  harnesses_.push_back(makeHarness(&inv_, {"10", "01"}));
  EXPECT_STREQ(checkTimingSense(harnesses_), "negative_unate");
}

TEST_F(HarnessListTest, TimingSenseNonUnate)
{
  harnesses_.push_back(makeHarness(&xor2_, {"01", "0", "01"}));
  harnesses_.push_back(makeHarness(&xor2_, {"01", "1", "10"}));
  EXPECT_STREQ(checkTimingSense(harnesses_), "non_unate");
}

TEST_F(HarnessListTest, TimingSenseEmpty)
{
  EXPECT_THROW(checkTimingSense(harnesses_), GridLookupError);
}

} // namespace cchar
