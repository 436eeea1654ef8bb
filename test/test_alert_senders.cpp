/*
 * test_alert_senders.cpp -- Unity tests for the email message and SMS
 * gateway request built by the delivery channels.
 */

#include <string>
#include <unity.h>

#include "alert_senders.hpp"
#include "exceptions.hpp"

static EmailConfig email;
static SmsConfig sms;

void
test_email_headers (void)
{
  std::string msg = SmtpEmailSender::buildMessage (email, "ELEMAC alarm: pH 1 too low", "Body",
                                                   "Sun, 18 Oct 2026 09:05:09 +0200");
  TEST_ASSERT_EQUAL_STRING ("Date: Sun, 18 Oct 2026 09:05:09 +0200\r\n"
                            "From: tank@example.org\r\n"
                            "To: a@example.org, b@example.org\r\n"
                            "Subject: ELEMAC alarm: pH 1 too low\r\n"
                            "Content-Type: text/plain; charset=utf-8\r\n"
                            "\r\n"
                            "Body\r\n",
                            msg.c_str ());
}

void
test_email_body_line_endings (void)
{
  std::string msg = SmtpEmailSender::buildMessage (email, "s", "one\ntwo\r\nthree", "d");
  TEST_ASSERT_TRUE (msg.find ("one\r\ntwo\r\nthree\r\n") != std::string::npos);
  TEST_ASSERT_TRUE (msg.find ("\r\r") == std::string::npos);
}

void
test_sms_request_body (void)
{
  TEST_ASSERT_EQUAL_STRING ("{\"to\":[\"+48111\",\"+48222\"],\"message\":\"pH 1 too low: 6.40 pH\"}",
                            SmsGatewaySender::buildRequestBody (sms, "pH 1 too low: 6.40 pH").c_str ());
}

void
test_sms_request_body_escapes_text (void)
{
  std::string body = SmsGatewaySender::buildRequestBody (sms, "say \"hi\"");
  TEST_ASSERT_TRUE (body.find ("\"message\":\"say \\\"hi\\\"\"") != std::string::npos);
}

void
test_incomplete_settings_skip_delivery (void)
{
  /* Neither sender touches the network without its required options. */
  EmailConfig no_host = email;
  no_host.host.clear ();
  SmtpEmailSender smtp (no_host);
  smtp.sendEmail ("s", "b");

  SmsConfig no_url = sms;
  no_url.url.clear ();
  SmsGatewaySender gateway (no_url, nullptr);
  gateway.sendSms ("text");
}

void
test_http_client_requires_absolute_url (void)
{
  HttpClient http (1000);
  HttpResponse resp = http.post ("/send", "{}", 2, "application/json");
  TEST_ASSERT_FALSE (resp.isSuccess ());
  TEST_ASSERT_TRUE (resp.error.find ("/send") != std::string::npos);
  TEST_ASSERT_EQUAL (0, resp.status_code);
}

void
test_sms_relative_url_fails_delivery (void)
{
  /* sms_url is used verbatim, there is no base to resolve it against. */
  SmsConfig relative = sms;
  relative.url = "sms.example.org/send";
  HttpClient http (1000);
  SmsGatewaySender gateway (relative, &http);
  int thrown = 0;
  try { gateway.sendSms ("text"); }
  catch (const DeliveryException&) { thrown = 1; }
  TEST_ASSERT_EQUAL (1, thrown);
}

/* -- Unity setup/teardown ------------------------------------------------- */

void
setUp (void)
{
  email = EmailConfig ();
  email.host = "smtp.example.org";
  email.port = 465;
  email.user = "tank@example.org";
  email.password = "secret";
  email.from = "tank@example.org";
  email.to.push_back ("a@example.org");
  email.to.push_back ("b@example.org");

  sms = SmsConfig ();
  sms.url = "https://sms.example.org/send";
  sms.to.push_back ("+48111");
  sms.to.push_back ("+48222");
}

void
tearDown (void)
{
}

int
main (void)
{
  UNITY_BEGIN ();

  RUN_TEST (test_email_headers);
  RUN_TEST (test_email_body_line_endings);
  RUN_TEST (test_sms_request_body);
  RUN_TEST (test_sms_request_body_escapes_text);
  RUN_TEST (test_incomplete_settings_skip_delivery);
  RUN_TEST (test_http_client_requires_absolute_url);
  RUN_TEST (test_sms_relative_url_fails_delivery);

  return UNITY_END ();
}
