#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "core/common/clock/clock.hpp"
#include "core/device/manager/status_registry.hpp"
#include "services/web_services/api/rest_api.hpp"

namespace devstatus::services::web_services::api {
namespace {

using core::common::clock::ManualClock;
using core::device::manager::RegistryOptions;
using core::device::manager::StatusRegistry;
using core::device::model::DeviceRecord;
using core::device::model::DeviceState;

bool Has(const ApiReply& r, const std::string& needle) { return r.body.find(needle) != std::string::npos; }

class DeviceApiTest : public ::testing::Test {
protected:
  void SetUp() override {
    RegistryOptions opt;
    opt.thresholds.stale_after_ms = 5'000;
    opt.thresholds.offline_after_ms = 15'000;
    std::vector<std::string> errors;
    registry_ = StatusRegistry::Create(opt, clock_, nullptr, errors);
    ASSERT_TRUE(registry_ != nullptr);
    ctx_.registry = registry_.get();
  }

  std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>(1'000);
  std::unique_ptr<StatusRegistry> registry_;
  ApiContext ctx_;
};

TEST(DecodeDeviceIdTest, PercentDecodesOneSegment) {
  std::string id;
  ASSERT_TRUE(DecodeDeviceId("pump%201", id));
  EXPECT_EQ(id, "pump 1");
  ASSERT_TRUE(DecodeDeviceId("42", id));
  EXPECT_EQ(id, "42");
  EXPECT_FALSE(DecodeDeviceId("", id));
  EXPECT_FALSE(DecodeDeviceId("a/b", id));
}

TEST_F(DeviceApiTest, ReportWithJsonBody) {
  const auto reply = ReportDevice(ctx_, "pump%201", R"({"battery":0.5,"fw":"1.2"})", "");
  EXPECT_EQ(reply.status, 200);
  EXPECT_TRUE(Has(reply, R"("accepted":true)"));
  EXPECT_TRUE(Has(reply, R"("applied":true)"));
  EXPECT_TRUE(Has(reply, R"("transitioned":true)"));
  EXPECT_TRUE(Has(reply, R"("state":"online")"));

  DeviceRecord r;
  ASSERT_TRUE(registry_->Query("pump 1", r));
  EXPECT_EQ(r.last_seen_ms, 1'000);
  EXPECT_EQ(std::get<std::string>(r.last_payload.at("fw")), "1.2");
}

TEST_F(DeviceApiTest, BlankBodyIsAnEmptyPayload) {
  const auto reply = ReportDevice(ctx_, "a", " \r\n", "");
  EXPECT_EQ(reply.status, 200);
  DeviceRecord r;
  ASSERT_TRUE(registry_->Query("a", r));
  EXPECT_TRUE(r.last_payload.empty());
}

TEST_F(DeviceApiTest, ReportRejectsBadInput) {
  auto reply = ReportDevice(ctx_, "a", "[1,2]", "");
  EXPECT_EQ(reply.status, 400);
  EXPECT_TRUE(Has(reply, "invalid_payload"));

  reply = ReportDevice(ctx_, "a", "{}", "12x");
  EXPECT_EQ(reply.status, 400);
  EXPECT_TRUE(Has(reply, "invalid_observed_at_ms"));

  reply = ReportDevice(ctx_, "a", "{}", "99999999999999999999");
  EXPECT_EQ(reply.status, 400);

  reply = ReportDevice(ctx_, "a/b", "{}", "");
  EXPECT_EQ(reply.status, 400);
  EXPECT_TRUE(Has(reply, "invalid_id"));

  EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(DeviceApiTest, ObservedAtFromTheQuery) {
  ReportDevice(ctx_, "a", "{}", "900");
  DeviceRecord r;
  ASSERT_TRUE(registry_->Query("a", r));
  EXPECT_EQ(r.last_seen_ms, 900);

  const auto reply = ReportDevice(ctx_, "a", "{}", "800");
  EXPECT_EQ(reply.status, 200);
  EXPECT_TRUE(Has(reply, R"("applied":false)"));
}

TEST_F(DeviceApiTest, WallClockObservedAtDoesNotPinTheDevice) {
  ReportDevice(ctx_, "a", "{}", "9223372036854775807");

  DeviceRecord r;
  ASSERT_TRUE(registry_->Query("a", r));
  EXPECT_EQ(r.last_seen_ms, 1'000);

  clock_->Set(7'000);
  EXPECT_EQ(registry_->SweepOnce().went_stale, 1u);
  const auto reply = GetDevice(ctx_, "a");
  EXPECT_EQ(reply.status, 200);
  EXPECT_TRUE(Has(reply, R"("state":"stale")"));
}

TEST_F(DeviceApiTest, GetDevice) {
  ReportDevice(ctx_, "dev%2D1", "{}", "");

  auto reply = GetDevice(ctx_, "dev-1");
  EXPECT_EQ(reply.status, 200);
  EXPECT_TRUE(Has(reply, R"("id":"dev-1")"));
  EXPECT_TRUE(Has(reply, R"("expires_in_ms":5000)"));

  reply = GetDevice(ctx_, "ghost");
  EXPECT_EQ(reply.status, 404);
  EXPECT_TRUE(Has(reply, "device_not_found"));
  EXPECT_EQ(GetDevice(ctx_, "").status, 404);
}

TEST_F(DeviceApiTest, ListWithStateFilter) {
  ReportDevice(ctx_, "a", "{}", "");
  clock_->Set(7'000);
  ReportDevice(ctx_, "b", "{}", "");
  registry_->SweepOnce();

  auto reply = ListDevices(ctx_, "");
  EXPECT_EQ(reply.status, 200);
  EXPECT_TRUE(Has(reply, R"("id":"a")"));
  EXPECT_TRUE(Has(reply, R"("id":"b")"));

  reply = ListDevices(ctx_, "stale");
  EXPECT_EQ(reply.status, 200);
  EXPECT_TRUE(Has(reply, R"("id":"a")"));
  EXPECT_FALSE(Has(reply, R"("id":"b")"));

  reply = ListDevices(ctx_, "offline");
  EXPECT_EQ(reply.body, "[]");

  reply = ListDevices(ctx_, "sleeping");
  EXPECT_EQ(reply.status, 400);
  EXPECT_TRUE(Has(reply, "invalid_state"));
}

TEST(DeviceApiWithoutRegistryTest, ReportsServerError) {
  ApiContext ctx;
  EXPECT_EQ(ListDevices(ctx, "").status, 500);
  EXPECT_EQ(GetDevice(ctx, "a").status, 500);
  EXPECT_EQ(ReportDevice(ctx, "a", "{}", "").status, 500);
}

}  // namespace
}  // namespace devstatus::services::web_services::api
