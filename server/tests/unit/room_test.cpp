#include <chrono>
#include <memory>
#include <set>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "wormhole/room.hpp"

using namespace std::chrono_literals;

namespace {

class RoomTimerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    io_thread_ = std::thread([this]() { ioc_.run(); });
  }

  void TearDown() override {
    channel_->Close();
    work_guard_.reset();
    ioc_.stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
  }

  std::unique_ptr<wormhole::Room> MakeRoom(wormhole::RoomId id, std::chrono::milliseconds idle_timeout) {
    return std::make_unique<wormhole::Room>(id, wormhole::RoomDeletionSender(channel_), ioc_, observability_,
                                            idle_timeout);
  }

  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_{
      boost::asio::make_work_guard(ioc_)};
  std::shared_ptr<wormhole::Observability> observability_ =
      std::make_shared<wormhole::Observability>(wormhole::LogLevel::kError);
  std::shared_ptr<wormhole::RoomDeletionChannel> channel_ = std::make_shared<wormhole::RoomDeletionChannel>(8);
  std::thread io_thread_;
};

}  // namespace

TEST_F(RoomTimerTest, ArmsTimerOnConstructionAndRequestsDeletionOnce) {
  auto room = MakeRoom(wormhole::RoomId(11), 100ms);
  EXPECT_EQ(room->GetDeletionState(), wormhole::DeletionState::kArmed);

  auto requested = channel_->ReceiveFor(2s);
  ASSERT_TRUE(requested.has_value());
  EXPECT_EQ(*requested, wormhole::RoomId(11));
  EXPECT_EQ(room->GetDeletionState(), wormhole::DeletionState::kFired);

  EXPECT_FALSE(channel_->ReceiveFor(300ms).has_value());
}

TEST_F(RoomTimerTest, CancelledTimerNeverRequestsDeletion) {
  auto room = MakeRoom(wormhole::RoomId(12), 150ms);
  room->CancelDeletion();
  EXPECT_EQ(room->GetDeletionState(), wormhole::DeletionState::kUnarmed);

  EXPECT_FALSE(channel_->ReceiveFor(500ms).has_value());
}

TEST_F(RoomTimerTest, CancelWithoutArmedTimerIsNoOp) {
  auto room = MakeRoom(wormhole::RoomId(13), 150ms);
  room->CancelDeletion();
  room->CancelDeletion();
  EXPECT_EQ(room->GetDeletionState(), wormhole::DeletionState::kUnarmed);
}

TEST_F(RoomTimerTest, RescheduleReplacesInsteadOfStacking) {
  auto room = MakeRoom(wormhole::RoomId(14), 100ms);
  room->ScheduleDeletion();
  room->ScheduleDeletion();
  EXPECT_EQ(room->GetDeletionState(), wormhole::DeletionState::kArmed);

  ASSERT_TRUE(channel_->ReceiveFor(2s).has_value());
  EXPECT_FALSE(channel_->ReceiveFor(400ms).has_value());
}

TEST_F(RoomTimerTest, RearmingAfterCancelSchedulesAgain) {
  auto room = MakeRoom(wormhole::RoomId(15), 100ms);
  room->CancelDeletion();
  room->ScheduleDeletion();

  auto requested = channel_->ReceiveFor(2s);
  ASSERT_TRUE(requested.has_value());
  EXPECT_EQ(*requested, wormhole::RoomId(15));
}

TEST_F(RoomTimerTest, DestroyingRoomCancelsItsTimer) {
  {
    auto room = MakeRoom(wormhole::RoomId(16), 100ms);
  }
  EXPECT_FALSE(channel_->ReceiveFor(400ms).has_value());
}

TEST_F(RoomTimerTest, FullChannelBlocksTimerUntilDrained) {
  channel_ = std::make_shared<wormhole::RoomDeletionChannel>(1);
  auto first = MakeRoom(wormhole::RoomId(21), 50ms);
  auto second = MakeRoom(wormhole::RoomId(22), 50ms);

  std::this_thread::sleep_for(300ms);
  EXPECT_EQ(channel_->Size(), 1u);

  std::set<wormhole::RoomId> received;
  for (int i = 0; i < 2; ++i) {
    auto requested = channel_->ReceiveFor(2s);
    ASSERT_TRUE(requested.has_value());
    received.insert(*requested);
  }
  EXPECT_EQ(received, (std::set<wormhole::RoomId>{wormhole::RoomId(21), wormhole::RoomId(22)}));
}

TEST_F(RoomTimerTest, PlayersHaveSetSemantics) {
  auto room = MakeRoom(wormhole::RoomId(30), 10s);
  EXPECT_TRUE(room->AddPlayer(wormhole::PlayerId(2)));
  EXPECT_TRUE(room->AddPlayer(wormhole::PlayerId(1)));
  EXPECT_FALSE(room->AddPlayer(wormhole::PlayerId(2)));
  EXPECT_EQ(room->PlayerCount(), 2u);
  EXPECT_TRUE(room->HasPlayer(wormhole::PlayerId(1)));

  auto snapshot = room->Snapshot();
  EXPECT_EQ(snapshot.id, wormhole::RoomId(30));
  ASSERT_EQ(snapshot.players.size(), 2u);
  EXPECT_EQ(snapshot.players[0], wormhole::PlayerId(1));
  EXPECT_EQ(snapshot.deletion_state, wormhole::DeletionState::kArmed);

  EXPECT_TRUE(room->RemovePlayer(wormhole::PlayerId(1)));
  EXPECT_FALSE(room->RemovePlayer(wormhole::PlayerId(1)));
  EXPECT_EQ(room->PlayerCount(), 1u);
}
