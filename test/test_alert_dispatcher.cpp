/*
 * test_alert_dispatcher.cpp -- Unity tests for alarm evaluation and
 * alert delivery through email and SMS.
 */

#include <string>
#include <unity.h>

#include "alarm_evaluator.hpp"
#include "alert_dispatcher.hpp"
#include "fakes.hpp"

static MemoryTimestampStore *store;
static AlertDeduplicator *dedup;
static RecordingEmail *email;
static RecordingSms *sms;
static AlertDispatcher *dispatcher;

static MeasurementRecord
temperature (double measured, double high, double low)
{
  MeasurementRecord r;
  r.code = "temp1";
  r.label = "Temperature 1";
  r.unit = "C";
  r.divisor = 10;
  r.available = true;
  r.values[FIELD_FLAGS] = 1;
  r.values[FIELD_MEASURED] = measured;
  r.values[FIELD_ALARM_HIGH] = high;
  r.values[FIELD_ALARM_LOW] = low;
  return r;
}

static bool
contains (const std::string &haystack, const char *needle)
{
  return haystack.find (needle) != std::string::npos;
}

/* -- evaluateAlarms ------------------------------------------------------- */

void
test_high_reading_raises_one_alarm (void)
{
  std::vector<MeasurementRecord> records (1, temperature (28.5, 28.0, 22.0));
  std::vector<Alarm> alarms = evaluateAlarms (records);

  TEST_ASSERT_EQUAL (1, (int)alarms.size ());
  TEST_ASSERT_EQUAL_STRING ("temp1", alarms[0].channel.c_str ());
  TEST_ASSERT_TRUE (contains (alarms[0].summary, "too high"));
  TEST_ASSERT_TRUE (contains (alarms[0].details, "28.5 C"));
  TEST_ASSERT_TRUE (contains (alarms[0].details, "28.0 C"));
  TEST_ASSERT_EQUAL_STRING ("Temperature 1 too high: 28.5 C", alarms[0].brief.c_str ());
}

void
test_low_reading_raises_one_alarm (void)
{
  std::vector<MeasurementRecord> records (1, temperature (21.0, 28.0, 22.0));
  std::vector<Alarm> alarms = evaluateAlarms (records);
  TEST_ASSERT_EQUAL (1, (int)alarms.size ());
  TEST_ASSERT_TRUE (contains (alarms[0].summary, "too low"));
}

void
test_limits_are_exclusive (void)
{
  std::vector<MeasurementRecord> records;
  records.push_back (temperature (28.0, 28.0, 22.0));
  records.push_back (temperature (22.0, 28.0, 22.0));
  TEST_ASSERT_EQUAL (0, (int)evaluateAlarms (records).size ());
}

void
test_inverted_limits_raise_both (void)
{
  /* Misconfigured controller: both checks fire independently. */
  std::vector<MeasurementRecord> records (1, temperature (25.0, 20.0, 30.0));
  TEST_ASSERT_EQUAL (2, (int)evaluateAlarms (records).size ());
}

void
test_unavailable_record_is_ignored (void)
{
  MeasurementRecord r = temperature (99.0, 28.0, 22.0);
  r.available = false;
  std::vector<MeasurementRecord> records (1, r);
  TEST_ASSERT_EQUAL (0, (int)evaluateAlarms (records).size ());
}

void
test_format_value_decimals (void)
{
  TEST_ASSERT_EQUAL_STRING ("23.5", formatValue (23.5, 10).c_str ());
  TEST_ASSERT_EQUAL_STRING ("7.12", formatValue (7.12, 100).c_str ());
  TEST_ASSERT_EQUAL_STRING ("350", formatValue (350, 1).c_str ());
}

/* -- AlertDispatcher ------------------------------------------------------ */

void
test_raise_sends_email_and_sms (void)
{
  TEST_ASSERT_TRUE (dispatcher->raise ("Subject", "Body", "Short", "temp1"));
  TEST_ASSERT_EQUAL (1, (int)email->sent.size ());
  TEST_ASSERT_EQUAL_STRING ("Subject", email->sent[0].first.c_str ());
  TEST_ASSERT_TRUE (contains (email->sent[0].second, "Body"));
  TEST_ASSERT_EQUAL (1, (int)sms->sent.size ());
  TEST_ASSERT_EQUAL_STRING ("Short", sms->sent[0].c_str ());
  TEST_ASSERT_EQUAL (1, store->saves);
}

void
test_brief_defaults_to_summary (void)
{
  dispatcher->raise ("Subject", "Body", "", "temp1");
  TEST_ASSERT_EQUAL_STRING ("Subject", sms->sent[0].c_str ());
}

void
test_suppression_note_appended (void)
{
  dispatcher->raise ("Subject", "Body", "Short", "temp1");
  const std::string &body = email->sent[0].second;
  TEST_ASSERT_EQUAL_STRING (("Body\n\n" + AlertDispatcher::suppressionNote (2)).c_str (), body.c_str ());
  TEST_ASSERT_TRUE (contains (body, "2 hour"));
}

void
test_no_note_for_empty_channel (void)
{
  dispatcher->raise ("Subject", "Body", "Short", "");
  TEST_ASSERT_EQUAL_STRING ("Body", email->sent[0].second.c_str ());
  TEST_ASSERT_EQUAL (0, store->saves);
}

void
test_suppressed_alert_contacts_nobody (void)
{
  TimePoint now = nowMicros ();
  store->values["temp1"] = formatIsoTimestamp (now - std::chrono::minutes (30));
  TEST_ASSERT_FALSE (dispatcher->raise ("Subject", "Body", "Short", "temp1", now));
  TEST_ASSERT_EQUAL (0, (int)email->sent.size ());
  TEST_ASSERT_EQUAL (0, (int)sms->sent.size ());
  TEST_ASSERT_EQUAL (0, store->saves);
}

void
test_second_raise_within_window_suppressed (void)
{
  TimePoint now = nowMicros ();
  TEST_ASSERT_TRUE (dispatcher->raise ("Subject", "Body", "Short", "temp1", now));
  TEST_ASSERT_FALSE (dispatcher->raise ("Subject", "Body", "Short", "temp1",
                                        now + std::chrono::minutes (10)));
  TEST_ASSERT_TRUE (dispatcher->raise ("Subject", "Body", "Short", "temp2",
                                       now + std::chrono::minutes (10)));
  TEST_ASSERT_EQUAL (2, (int)email->sent.size ());
}

void
test_email_failure_still_sends_sms_and_records (void)
{
  email->fail = true;
  TEST_ASSERT_TRUE (dispatcher->raise ("Subject", "Body", "Short", "temp1"));
  TEST_ASSERT_EQUAL (1, (int)email->sent.size ());
  TEST_ASSERT_EQUAL (1, (int)sms->sent.size ());
  TEST_ASSERT_EQUAL (1, store->saves);
}

void
test_sms_failure_still_records (void)
{
  sms->fail = true;
  TEST_ASSERT_TRUE (dispatcher->raise ("Subject", "Body", "Short", "temp1"));
  TEST_ASSERT_EQUAL (1, (int)email->sent.size ());
  TEST_ASSERT_EQUAL (1, store->saves);
}

void
test_missing_senders_tolerated (void)
{
  AlertDispatcher bare (dedup, nullptr, nullptr);
  TEST_ASSERT_TRUE (bare.raise ("Subject", "Body", "Short", "temp1"));
  TEST_ASSERT_EQUAL (1, store->saves);
}

void
test_raise_alarms_counts_delivered (void)
{
  std::vector<MeasurementRecord> records;
  records.push_back (temperature (28.5, 28.0, 22.0));
  MeasurementRecord ph = temperature (6.0, 8.0, 6.5);
  ph.code = "ph1";
  records.push_back (ph);

  TEST_ASSERT_EQUAL (2, raiseAlarms (evaluateAlarms (records), dispatcher));
  /* Same readings again: both channels are inside the window. */
  TEST_ASSERT_EQUAL (0, raiseAlarms (evaluateAlarms (records), dispatcher));
  TEST_ASSERT_EQUAL (2, (int)sms->sent.size ());
}

/* -- Unity setup/teardown ------------------------------------------------- */

void
setUp (void)
{
  AlertConfig window = {true, 2.0};
  store = new MemoryTimestampStore ();
  dedup = new AlertDeduplicator (store, window);
  email = new RecordingEmail ();
  sms = new RecordingSms ();
  dispatcher = new AlertDispatcher (dedup, email, sms);
}

void
tearDown (void)
{
  delete dispatcher;
  delete sms;
  delete email;
  delete dedup;
  delete store;
}

int
main (void)
{
  UNITY_BEGIN ();

  RUN_TEST (test_high_reading_raises_one_alarm);
  RUN_TEST (test_low_reading_raises_one_alarm);
  RUN_TEST (test_limits_are_exclusive);
  RUN_TEST (test_inverted_limits_raise_both);
  RUN_TEST (test_unavailable_record_is_ignored);
  RUN_TEST (test_format_value_decimals);

  RUN_TEST (test_raise_sends_email_and_sms);
  RUN_TEST (test_brief_defaults_to_summary);
  RUN_TEST (test_suppression_note_appended);
  RUN_TEST (test_no_note_for_empty_channel);
  RUN_TEST (test_suppressed_alert_contacts_nobody);
  RUN_TEST (test_second_raise_within_window_suppressed);
  RUN_TEST (test_email_failure_still_sends_sms_and_records);
  RUN_TEST (test_sms_failure_still_records);
  RUN_TEST (test_missing_senders_tolerated);
  RUN_TEST (test_raise_alarms_counts_delivered);

  return UNITY_END ();
}
