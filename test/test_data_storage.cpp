/*
 * test_data_storage.cpp -- Unity tests for the chart data log.
 */

#include <fstream>
#include <stdlib.h>
#include <string>
#include <unistd.h>
#include <unity.h>

#include "data_storage.hpp"
#include "exceptions.hpp"

static MeasurementMap records;
static TimePoint now;

static void
add_record (const char *code, double measured, bool available)
{
  MeasurementRecord r;
  r.code = code;
  r.available = available;
  r.values[FIELD_FLAGS] = available ? 1 : 0;
  r.values[FIELD_MEASURED] = measured;
  records[code] = r;
}

void
test_line_has_sorted_keys_of_available_banks (void)
{
  add_record ("temp1", 23.5, true);
  add_record ("redox", 350, true);
  add_record ("ph1", 7.25, true);
  add_record ("humidity", 61.5, false);

  std::string expected = "{\"ph1\":7.25,\"redox\":350,\"temp1\":23.5,\"timestamp\":\""
                         + formatChartTimestamp (now) + "\"}";
  TEST_ASSERT_EQUAL_STRING (expected.c_str (), ChartDataStore::buildLine (records, now).c_str ());
}

void
test_line_without_readings_has_only_timestamp (void)
{
  add_record ("temp1", 23.5, false);
  std::string expected = "{\"timestamp\":\"" + formatChartTimestamp (now) + "\"}";
  TEST_ASSERT_EQUAL_STRING (expected.c_str (), ChartDataStore::buildLine (records, now).c_str ());
}

void
test_chart_timestamp_format (void)
{
  std::string ts = formatChartTimestamp (now);
  TEST_ASSERT_EQUAL (19, (int)ts.size ());
  TEST_ASSERT_EQUAL_CHAR ('-', ts[4]);
  TEST_ASSERT_EQUAL_CHAR (' ', ts[10]);
  TEST_ASSERT_EQUAL_CHAR (':', ts[13]);
}

void
test_append_adds_one_line_per_call (void)
{
  char path[] = "/tmp/elemac_chart_XXXXXX";
  int fd = mkstemp (path);
  TEST_ASSERT_TRUE (fd >= 0);
  close (fd);

  add_record ("temp1", 23.5, true);
  ChartDataStore chart (path);
  chart.append (records, now);
  chart.append (records, now + std::chrono::seconds (60));

  std::ifstream in (path);
  std::string first, second, third;
  TEST_ASSERT_TRUE ((bool)std::getline (in, first));
  TEST_ASSERT_TRUE ((bool)std::getline (in, second));
  TEST_ASSERT_FALSE ((bool)std::getline (in, third));
  TEST_ASSERT_EQUAL_STRING (ChartDataStore::buildLine (records, now).c_str (), first.c_str ());
  unlink (path);
}

void
test_append_to_unwritable_path (void)
{
  ChartDataStore chart ("/nonexistent/elemac/chart.jsonl");
  int thrown = 0;
  try { chart.append (records, now); }
  catch (const ConfigException&) { thrown = 1; }
  TEST_ASSERT_EQUAL (1, thrown);
}

/* -- Unity setup/teardown ------------------------------------------------- */

void
setUp (void)
{
  records.clear ();
  now = nowMicros ();
}

void
tearDown (void)
{
}

int
main (void)
{
  UNITY_BEGIN ();

  RUN_TEST (test_line_has_sorted_keys_of_available_banks);
  RUN_TEST (test_line_without_readings_has_only_timestamp);
  RUN_TEST (test_chart_timestamp_format);
  RUN_TEST (test_append_adds_one_line_per_call);
  RUN_TEST (test_append_to_unwritable_path);

  return UNITY_END ();
}
