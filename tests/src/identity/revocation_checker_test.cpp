#include <gtest/gtest.h>
#include <trustgate/identity/revocation_checker.hpp>
#include <trustgate/ledger/local_ledger.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

trustgate::schema::certificate_t certificate(const std::string& serial,
                                             const std::string& outpoint) {
  auto cert = trustgate::schema::certificate_t{};
  cert.serial_number = serial;
  cert.revocation_outpoint = outpoint;
  return cert;
}

}  // namespace

TEST(local_revocation_checker, subscribers_are_notified_once) {
  auto checker = trustgate::identity::local_revocation_checker{};
  auto cert = certificate("serial-1", "tx:0");
  auto notified = std::vector<std::string>{};
  auto subscription = checker.subscribe_to_revocation(
      cert, [&](const std::string& serial) { notified.push_back(serial); });

  EXPECT_EQ(checker.is_revoked(cert), false);
  checker.revoke("serial-2");
  EXPECT_TRUE(notified.empty());

  checker.revoke("serial-1");
  checker.revoke("serial-1");
  ASSERT_EQ(notified.size(), 1u);
  EXPECT_EQ(notified[0], "serial-1");
  EXPECT_EQ(checker.is_revoked(cert), true);
}

TEST(local_revocation_checker, dropped_subscription_is_cancelled) {
  auto checker = trustgate::identity::local_revocation_checker{};
  auto cert = certificate("serial-1", "tx:0");
  auto calls = 0;
  {
    auto subscription = checker.subscribe_to_revocation(
        cert, [&](const std::string&) { ++calls; });
  }
  checker.revoke("serial-1");
  EXPECT_EQ(calls, 0);
}

TEST(local_revocation_checker, already_revoked_fires_immediately) {
  auto checker = trustgate::identity::local_revocation_checker{};
  checker.sync({"serial-1", "serial-2"});
  EXPECT_TRUE(checker.contains("serial-2"));

  auto calls = 0;
  auto subscription = checker.subscribe_to_revocation(
      certificate("serial-1", "tx:0"), [&](const std::string&) { ++calls; });
  EXPECT_EQ(calls, 1);

  auto statuses = checker.batch_check_revocations(
      {certificate("serial-1", "a:0"), certificate("serial-3", "b:0")});
  EXPECT_TRUE(statuses.at("serial-1"));
  EXPECT_FALSE(statuses.at("serial-3"));
}

TEST(local_revocation_checker, concurrent_revoke_notifies_every_subscriber) {
  for (auto round = 0; round < 200; ++round) {
    auto checker = trustgate::identity::local_revocation_checker{};
    auto cert = certificate("serial-1", "tx:0");
    auto calls = std::atomic<int>{0};
    auto subscription = trustgate::identity::revocation_subscription{};

    auto revoker = std::thread{[&] { checker.revoke("serial-1"); }};
    subscription = checker.subscribe_to_revocation(
        cert, [&](const std::string&) { ++calls; });
    revoker.join();

    ASSERT_EQ(calls.load(), 1) << "round " << round;
  }
}

TEST(ledger_revocation_checker, spent_outpoint_means_revoked) {
  auto ledger = std::make_shared<trustgate::ledger::local_ledger>();
  auto checker = trustgate::identity::ledger_revocation_checker{
      ledger, std::chrono::milliseconds{0}};
  auto issued = ledger->publish(trustgate::schema::make_bytes_view(
      std::string{"certificate"}));
  auto cert = certificate("serial-1", issued + ":0");

  auto calls = 0;
  auto subscription = checker.subscribe_to_revocation(
      cert, [&](const std::string&) { ++calls; });
  EXPECT_EQ(checker.is_revoked(cert), false);
  EXPECT_EQ(checker.poll(), 0u);

  ledger->spend_outpoint(cert.revocation_outpoint,
                         trustgate::schema::make_bytes_view(
                             std::string{"revoked"}));
  EXPECT_EQ(checker.is_revoked(cert), true);
  EXPECT_EQ(checker.poll(), 1u);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(checker.poll(), 0u);
}

TEST(ledger_revocation_checker, offline_ledger_leaves_status_unknown) {
  auto ledger = std::make_shared<trustgate::ledger::local_ledger>();
  auto checker = trustgate::identity::ledger_revocation_checker{
      ledger, std::chrono::milliseconds{0}};
  auto cert = certificate("serial-1", "tx:0");

  ledger->set_offline(true);
  EXPECT_FALSE(checker.is_revoked(cert).has_value());
  EXPECT_TRUE(checker.batch_check_revocations({cert}).empty());

  auto detached = trustgate::identity::ledger_revocation_checker{
      nullptr, std::chrono::milliseconds{0}};
  EXPECT_FALSE(detached.is_revoked(cert).has_value());
}
