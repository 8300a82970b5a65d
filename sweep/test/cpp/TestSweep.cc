#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <thread>
#include <utility>
#include "Error.hh"
#include "CharError.hh"
#include "Metric.hh"
#include "ResultTable.hh"
#include "CellTopology.hh"
#include "Harness.hh"
#include "CharSettings.hh"
#include "SimOracle.hh"
#include "SweepEngine.hh"
#include "MetricAggregator.hh"
#include "CellChar.hh"

namespace cchar {

typedef std::pair<size_t, size_t> GridPoint;

// Measurements are a function of the declared slew and load so results
// can be checked independent of the order grid points are simulated in.
class FakeOracle : public SimOracle
{
public:
  explicit FakeOracle(bool random_delay) :
    random_delay_(random_delay),
    fail_pass_(0),
    omit_metric_(Metric::prop_in_out),
    omit_pass_(0),
    call_count_(0),
    window_mismatch_(false)
  {
  }

  void failAt(size_t slew_index,
              size_t load_index,
              int pass)
  {
    fail_points_.insert(GridPoint(slew_index, load_index));
    fail_pass_ = pass;
  }

  void omitMetric(Metric metric,
                  int pass)
  {
    omit_metric_ = metric;
    omit_pass_ = pass;
  }

  int callCount() const { return call_count_; }
  bool windowMismatch() const { return window_mismatch_; }

  static double energyStart(const SimRequest &request)
  {
    return 1e-9 + request.slew * 1e-10;
  }

  static double energyEnd(const SimRequest &request)
  {
    return 3e-9 + request.load * 1e-10;
  }

  void simulate(const SimRequest &request,
                MetricValues &measurements) override
  {
    call_count_++;
    if (random_delay_) {
      unsigned seed;
      {
        std::lock_guard<std::mutex> lock(rand_lock_);
        seed = rand_();
      }
      std::this_thread::sleep_for(std::chrono::microseconds(seed % 2000));
    }
    if (request.pass == fail_pass_
        && fail_points_.count(GridPoint(request.slew_index,
                                        request.load_index)))
      throw SimulationFailure(request.slew, request.load, request.pass,
                              "fake simulator error");

    double slew = request.slew;
    double load = request.load;
    measurements[Metric::prop_in_out] = 1e-11 * slew + 2e-12 * load;
    measurements[Metric::trans_out] = 2e-11 * slew + 4e-12 * load;
    if (request.has_energy_window) {
      if (request.energy_start != energyStart(request)
          || request.energy_end != energyEnd(request))
        window_mismatch_ = true;
      measurements[Metric::q_in_dyn] = -1e-15 * (1.0 + slew);
      measurements[Metric::q_out_dyn] = 2e-15 * load;
      measurements[Metric::q_vdd_dyn] = 5e-15 * (1.0 + load);
      measurements[Metric::q_vss_dyn] = -4e-15 * (1.0 + slew);
      measurements[Metric::i_in_leak] = 1e-13;
      measurements[Metric::i_vdd_leak] = 2e-12;
      measurements[Metric::i_vss_leak] = -4e-12;
    }
    else {
      measurements[Metric::energy_start] = energyStart(request);
      measurements[Metric::energy_end] = energyEnd(request);
    }
    if (request.pass == omit_pass_)
      measurements.erase(omit_metric_);
  }

private:
  bool random_delay_;
  std::set<GridPoint> fail_points_;
  int fail_pass_;
  Metric omit_metric_;
  int omit_pass_;
  std::atomic<int> call_count_;
  std::atomic<bool> window_mismatch_;
  std::mt19937 rand_;
  std::mutex rand_lock_;
};

class SweepTest : public ::testing::Test {
protected:
  void SetUp() override {
    cell_char_.makeComponents();
    cell_ = cell_char_.makeCell("INV");
    cell_->addInPort("A");
    cell_->addOutPort("Y");
    cell_->setSlews({0.1f, 0.5f, 1.0f});
    cell_->setLoads({1.0f, 2.0f, 4.0f, 8.0f});
  }

  CellChar cell_char_;
  CellTopology *cell_;
};

////////////////////////////////////////////////////////////////
// Sweep engine
////////////////////////////////////////////////////////////////

TEST_F(SweepTest, MakeRequest)
{
  std::unique_ptr<Harness> harness(makeHarness(cell_, {"01", "10"}));
  SweepEngine engine(&cell_char_);
  float slew_mag = cell_char_.settings()->slewMagnitude();
  SimRequest request = engine.makeRequest(cell_, harness.get(), slew_mag, 1, 2);
  EXPECT_EQ(request.pass, 1);
  EXPECT_FALSE(request.has_energy_window);
  EXPECT_EQ(request.in_direction, harness->inDirection());
  EXPECT_EQ(request.out_direction, harness->outDirection());
  EXPECT_FLOAT_EQ(request.slew, 0.5f);
  EXPECT_FLOAT_EQ(request.load, 4.0f);
  EXPECT_EQ(request.slew_index, 1u);
  EXPECT_EQ(request.load_index, 2u);
  // 0.5 * 1 / (0.8 - 0.2) ns
  EXPECT_NEAR(request.slew_time, 0.5 / 0.6 * 1e-9, 1e-15);
  EXPECT_NEAR(request.load_cap, 4e-12, 1e-18);
  EXPECT_FLOAT_EQ(request.vdd_voltage, 3.3f);
  EXPECT_FLOAT_EQ(request.temperature, 25.0f);
  EXPECT_EQ(request.measurements().size(), windowPassMetrics().size());
}

TEST_F(SweepTest, SerialSweepCoversGrid)
{
  std::unique_ptr<Harness> harness(makeHarness(cell_, {"01", "10"}));
  FakeOracle oracle(false);
  SweepEngine engine(&cell_char_);
  engine.sweep(cell_, harness.get(), &oracle);

  const ResultTable &results = harness->results();
  EXPECT_EQ(oracle.callCount(), 2 * 12);
  EXPECT_FALSE(oracle.windowMismatch());
  EXPECT_TRUE(results.isComplete(rawMetrics()));
  for (size_t si = 0; si < results.slewCount(); si++) {
    for (size_t li = 0; li < results.loadCount(); li++) {
      // Raw measurements only, no extra keys.
      EXPECT_EQ(results.values(si, li).size(), rawMetrics().size());
      double slew = results.slews()[si];
      double load = results.loads()[li];
      EXPECT_DOUBLE_EQ(results.value(si, li, Metric::prop_in_out),
                       1e-11 * slew + 2e-12 * load);
      EXPECT_DOUBLE_EQ(results.value(si, li, Metric::energy_end),
                       3e-9 + load * 1e-10);
    }
  }
}

TEST_F(SweepTest, ConcurrentSweepCoversGrid)
{
  cell_char_.setThreadCount(6);
  std::unique_ptr<Harness> harness(makeHarness(cell_, {"10", "01"}));
  FakeOracle oracle(true);
  SweepEngine engine(&cell_char_);
  engine.sweep(cell_, harness.get(), &oracle);
  EXPECT_EQ(oracle.callCount(), 2 * 12);
  EXPECT_FALSE(oracle.windowMismatch());
  EXPECT_TRUE(harness->results().isComplete(rawMetrics()));
}

TEST_F(SweepTest, FailureWritesNothing)
{
  cell_char_.setThreadCount(4);
  std::unique_ptr<Harness> harness(makeHarness(cell_, {"01", "10"}));
  FakeOracle oracle(true);
  oracle.failAt(1, 3, 2);
  SweepEngine engine(&cell_char_);
  try {
    engine.sweep(cell_, harness.get(), &oracle);
    FAIL() << "sweep did not report the simulation failure";
  }
  catch (SimulationFailure &failure) {
    EXPECT_FLOAT_EQ(failure.slew(), 0.5f);
    EXPECT_FLOAT_EQ(failure.load(), 8.0f);
    EXPECT_EQ(failure.pass(), 2);
    EXPECT_EQ(failure.msg(), "fake simulator error");
  }
  // Every other task ran to completion before the failure surfaced.
  EXPECT_EQ(oracle.callCount(), 2 * 12);
  const ResultTable &results = harness->results();
  for (size_t si = 0; si < results.slewCount(); si++) {
    for (size_t li = 0; li < results.loadCount(); li++)
      EXPECT_TRUE(results.values(si, li).empty());
  }
}

TEST_F(SweepTest, FirstFailureInGridOrder)
{
  cell_char_.setThreadCount(4);
  std::unique_ptr<Harness> harness(makeHarness(cell_, {"01", "10"}));
  FakeOracle oracle(true);
  oracle.failAt(2, 0, 1);
  oracle.failAt(0, 2, 1);
  SweepEngine engine(&cell_char_);
  try {
    engine.sweep(cell_, harness.get(), &oracle);
    FAIL() << "sweep did not report the simulation failure";
  }
  catch (SimulationFailure &failure) {
    EXPECT_FLOAT_EQ(failure.slew(), 0.1f);
    EXPECT_FLOAT_EQ(failure.load(), 4.0f);
    EXPECT_EQ(failure.pass(), 1);
  }
}

TEST_F(SweepTest, MissingMeasurementFails)
{
  std::unique_ptr<Harness> harness(makeHarness(cell_, {"01", "10"}));
  FakeOracle oracle(false);
  oracle.omitMetric(Metric::i_vss_leak, 2);
  SweepEngine engine(&cell_char_);
  try {
    engine.sweep(cell_, harness.get(), &oracle);
    FAIL() << "sweep accepted a missing measurement";
  }
  catch (SimulationFailure &failure) {
    EXPECT_EQ(failure.pass(), 2);
    EXPECT_NE(failure.msg().find("i_vss_leak"), std::string::npos);
  }
  EXPECT_TRUE(harness->results().values(0, 0).empty());
}

TEST_F(SweepTest, MissingWindowFails)
{
  std::unique_ptr<Harness> harness(makeHarness(cell_, {"01", "10"}));
  FakeOracle oracle(false);
  oracle.omitMetric(Metric::energy_start, 1);
  SweepEngine engine(&cell_char_);
  try {
    engine.sweep(cell_, harness.get(), &oracle);
    FAIL() << "sweep accepted a missing energy window";
  }
  catch (SimulationFailure &failure) {
    EXPECT_EQ(failure.pass(), 1);
  }
}

TEST_F(SweepTest, ResultsIndependentOfScheduling)
{
  cell_->setSlews({0.05f, 0.1f, 0.2f, 0.4f, 0.8f});
  cell_->setLoads({0.5f, 1.0f, 2.0f, 4.0f, 8.0f, 16.0f});
  cell_char_.addTestVector(cell_, {"01", "10"});
  cell_char_.addTestVector(cell_, {"10", "01"});

  CellChar serial;
  serial.makeComponents();
  serial.setOracle(new FakeOracle(false));
  CellTopology *serial_cell = serial.makeCell("INV");
  serial_cell->addInPort("A");
  serial_cell->addOutPort("Y");
  serial_cell->setSlews(cell_->slews());
  serial_cell->setLoads(cell_->loads());
  serial.addTestVector(serial_cell, {"01", "10"});
  serial.addTestVector(serial_cell, {"10", "01"});
  serial.characterize(serial_cell);

  cell_char_.setThreadCount(8);
  cell_char_.setOracle(new FakeOracle(true));
  // Repeat to vary the task interleaving.
  for (int run = 0; run < 3; run++) {
    cell_char_.characterize(cell_);
    const HarnessSeq &harnesses = cell_char_.harnesses(cell_);
    const HarnessSeq &serial_harnesses = serial.harnesses(serial_cell);
    ASSERT_EQ(harnesses.size(), serial_harnesses.size());
    for (size_t h = 0; h < harnesses.size(); h++) {
      const ResultTable &results = harnesses[h]->results();
      const ResultTable &serial_results = serial_harnesses[h]->results();
      for (size_t si = 0; si < results.slewCount(); si++) {
        for (size_t li = 0; li < results.loadCount(); li++)
          EXPECT_EQ(results.values(si, li), serial_results.values(si, li));
      }
      EXPECT_EQ(harnesses[h]->averagePropagationDelay(),
                serial_harnesses[h]->averagePropagationDelay());
      EXPECT_EQ(harnesses[h]->averageInputCapacitance(),
                serial_harnesses[h]->averageInputCapacitance());
    }
  }
}

////////////////////////////////////////////////////////////////
// Metric aggregation
////////////////////////////////////////////////////////////////

static MetricValues
rawValues()
{
  MetricValues raw;
  raw[Metric::q_in_dyn] = -2e-15;
  raw[Metric::q_vdd_dyn] = 5e-15;
  raw[Metric::q_vss_dyn] = -8e-15;
  raw[Metric::i_vdd_leak] = 2e-12;
  raw[Metric::i_vss_leak] = -4e-12;
  raw[Metric::energy_start] = 1e-9;
  raw[Metric::energy_end] = 3e-9;
  return raw;
}

TEST(MetricAggregatorTest, InternalEnergy)
{
  MetricValues raw = rawValues();
  double window = 3e-9 - 1e-9;
  double expected = (5e-15 - window * 3e-12) * 3.3f;
  EXPECT_NEAR(internalEnergy(raw, 3.3f, 1.0f), expected, 1e-28);
  EXPECT_NEAR(internalEnergy(raw, 3.3f, 0.5f), expected * 0.5, 1e-28);
}

TEST(MetricAggregatorTest, InternalEnergyRailSwap)
{
  MetricValues raw = rawValues();
  MetricValues swapped = raw;
  swapped[Metric::q_vdd_dyn] = raw[Metric::q_vss_dyn];
  swapped[Metric::q_vss_dyn] = raw[Metric::q_vdd_dyn];
  EXPECT_DOUBLE_EQ(internalEnergy(raw, 1.2f, 1.0f),
                   internalEnergy(swapped, 1.2f, 1.0f));
  MetricValues negated = raw;
  negated[Metric::q_vdd_dyn] = -raw[Metric::q_vdd_dyn];
  negated[Metric::q_vss_dyn] = -raw[Metric::q_vss_dyn];
  EXPECT_DOUBLE_EQ(internalEnergy(raw, 1.2f, 1.0f),
                   internalEnergy(negated, 1.2f, 1.0f));
}

TEST(MetricAggregatorTest, InternalEnergyNonNegative)
{
  MetricValues raw = rawValues();
  // Leakage over the window exceeds the rail charge.
  raw[Metric::i_vdd_leak] = 1e-5;
  raw[Metric::i_vss_leak] = 1e-5;
  double energy = internalEnergy(raw, 3.3f, 1.0f);
  EXPECT_GT(energy, 0.0);
  EXPECT_NEAR(energy, (2e-9 * 1e-5 - 5e-15) * 3.3f, 1e-24);
}

TEST(MetricAggregatorTest, InputEnergyAndCapacitance)
{
  MetricValues raw = rawValues();
  EXPECT_NEAR(inputEnergy(raw, 3.3f), 2e-15 * 3.3f, 1e-28);
  EXPECT_NEAR(inputCapacitance(raw, 3.3f), 2e-15 / 3.3f, 1e-28);
}

TEST(MetricAggregatorTest, LeakagePower)
{
  MetricValues raw = rawValues();
  EXPECT_NEAR(leakagePower(raw, 3.3f), 3e-12 * 3.3f, 1e-25);
}

TEST(MetricAggregatorTest, MissingRawValue)
{
  MetricValues raw = rawValues();
  raw.erase(Metric::i_vss_leak);
  EXPECT_THROW(leakagePower(raw, 3.3f), GridLookupError);
  EXPECT_THROW(internalEnergy(raw, 3.3f, 1.0f), GridLookupError);
  EXPECT_NO_THROW(inputEnergy(raw, 3.3f));
}

TEST_F(SweepTest, AggregateWritesDerivedMetrics)
{
  std::unique_ptr<Harness> harness(makeHarness(cell_, {"01", "10"}));
  FakeOracle oracle(false);
  SweepEngine engine(&cell_char_);
  engine.sweep(cell_, harness.get(), &oracle);
  MetricAggregator aggregator(&cell_char_);
  aggregator.aggregate(harness.get());

  const ResultTable &results = harness->results();
  EXPECT_TRUE(results.isComplete(derivedMetrics()));
  float vdd = cell_char_.settings()->vddVoltage();
  const MetricValues &raw = results.values(1, 2);
  EXPECT_DOUBLE_EQ(results.value(1, 2, Metric::internal_energy),
                   internalEnergy(raw, vdd, 1.0f));
  EXPECT_DOUBLE_EQ(results.value(1, 2, Metric::input_capacitance),
                   inputCapacitance(raw, vdd));
  // Aggregating twice would overwrite recorded results.
  EXPECT_THROW(aggregator.aggregate(harness.get()), ExceptionMsg);
}

TEST_F(SweepTest, AggregateScaleByThreshold)
{
  cell_char_.settings()->setEnergyScaleByThreshold(true);
  std::unique_ptr<Harness> harness(makeHarness(cell_, {"01", "10"}));
  FakeOracle oracle(false);
  SweepEngine engine(&cell_char_);
  engine.sweep(cell_, harness.get(), &oracle);
  MetricAggregator aggregator(&cell_char_);
  aggregator.aggregate(harness.get());
  const ResultTable &results = harness->results();
  float vdd = cell_char_.settings()->vddVoltage();
  float scale = cell_char_.settings()->energyMeasHighThreshold();
  EXPECT_DOUBLE_EQ(results.value(0, 0, Metric::internal_energy),
                   internalEnergy(results.values(0, 0), vdd, scale));
}

////////////////////////////////////////////////////////////////
// Result table
////////////////////////////////////////////////////////////////

TEST(ResultTableTest, WriteOnce)
{
  ResultTable results({0.1f, 0.2f}, {1.0f});
  EXPECT_FALSE(results.hasValue(1, 0, Metric::trans_out));
  results.setValue(1, 0, Metric::trans_out, 2e-11);
  EXPECT_TRUE(results.hasValue(1, 0, Metric::trans_out));
  EXPECT_THROW(results.setValue(1, 0, Metric::trans_out, 3e-11), ExceptionMsg);
  EXPECT_DOUBLE_EQ(results.value(1, 0, Metric::trans_out), 2e-11);
}

TEST(ResultTableTest, Keys)
{
  ResultTable results({0.1f, 0.25f}, {1.0f, 16.0f});
  EXPECT_EQ(results.slewKey(1), "0.25");
  EXPECT_EQ(results.loadKey(1), "16");
}

TEST(ResultTableTest, FindValue)
{
  ResultTable results({0.1f, 0.2f}, {1.0f, 2.0f});
  results.setValue(1, 1, Metric::prop_in_out, 4e-11);
  EXPECT_DOUBLE_EQ(results.findValue(0.2f, 2.0f, Metric::prop_in_out), 4e-11);
  EXPECT_EQ(results.slewIndex(0.1f), 0u);
  EXPECT_EQ(results.loadIndex(2.0f), 1u);
}

TEST(ResultTableTest, LookupNoneFound)
{
  ResultTable results({0.1f}, {1.0f});
  try {
    results.findValue(0.3f, 1.0f, Metric::prop_in_out);
    FAIL() << "no exception for undeclared slew";
  }
  catch (GridLookupError &error) {
    EXPECT_EQ(error.failure(), LookupFailure::none_found);
  }
  // Declared point without the metric.
  EXPECT_THROW(results.value(0, 0, Metric::prop_in_out), GridLookupError);
  // Outside the grid.
  EXPECT_THROW(results.values(1, 0), GridLookupError);
}

TEST(ResultTableTest, LookupAmbiguous)
{
  ResultTable results({0.1f, 0.1f}, {1.0f});
  try {
    results.slewIndex(0.1f);
    FAIL() << "no exception for repeated slew";
  }
  catch (GridLookupError &error) {
    EXPECT_EQ(error.failure(), LookupFailure::ambiguous);
  }
}

TEST(ResultTableTest, EmptyGrid)
{
  ResultTable results({}, {1.0f});
  EXPECT_EQ(results.size(), 0u);
  EXPECT_TRUE(results.isComplete(rawMetrics()));
}

////////////////////////////////////////////////////////////////
// Metric names
////////////////////////////////////////////////////////////////

TEST(MetricTest, Names)
{
  EXPECT_STREQ(metricName(Metric::q_vdd_dyn), "q_vdd_dyn");
  Metric metric;
  bool exists;
  findMetric("leakage_power", metric, exists);
  EXPECT_TRUE(exists);
  EXPECT_EQ(metric, Metric::leakage_power);
  findMetric("slack", metric, exists);
  EXPECT_FALSE(exists);
  EXPECT_EQ(metricNames().find("prop_in_out trans_out"), 0u);
}

TEST(MetricTest, PassMetrics)
{
  EXPECT_EQ(windowPassMetrics().size(), 4u);
  EXPECT_EQ(measurePassMetrics().size(), 9u);
  EXPECT_EQ(rawMetrics().size(), 11u);
  EXPECT_EQ(derivedMetrics().size(), 4u);
}

} // namespace cchar
