#include <gtest/gtest.h>
#include "pairlink/transfer/transfer_events.hpp"
#include "pairlink/transfer/transfer_manager.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>

using namespace pairlink::transfer;
using namespace std::chrono_literals;

class TransferEventParserTest : public ::testing::Test {};

TEST_F(TransferEventParserTest, ParseIncomingStart) {
    auto event = parse_transfer_event("start incoming in-1 2048 image/jpeg holiday photo.jpg");

    ASSERT_TRUE(std::holds_alternative<StartEvent>(event));
    const auto& start = std::get<StartEvent>(event);
    EXPECT_EQ(start.direction, TransferDirection::INCOMING);
    EXPECT_EQ(start.id, "in-1");
    EXPECT_EQ(start.size, 2048u);
    EXPECT_EQ(start.mime, "image/jpeg");
    EXPECT_EQ(start.name, "holiday photo.jpg");
    EXPECT_EQ(start.chunk_size, 0u);
}

TEST_F(TransferEventParserTest, ParseOutgoingStart) {
    auto event = parse_transfer_event("start outgoing out-7 4096 application/pdf 512 report.pdf");

    ASSERT_TRUE(std::holds_alternative<StartEvent>(event));
    const auto& start = std::get<StartEvent>(event);
    EXPECT_EQ(start.direction, TransferDirection::OUTGOING);
    EXPECT_EQ(start.id, "out-7");
    EXPECT_EQ(start.chunk_size, 512u);
    EXPECT_EQ(start.name, "report.pdf");
    EXPECT_EQ(event_transfer_id(event), "out-7");
}

TEST_F(TransferEventParserTest, ParseProgress) {
    auto event = parse_transfer_event("  progress in-1 1024  ");

    ASSERT_TRUE(std::holds_alternative<ProgressEvent>(event));
    EXPECT_EQ(std::get<ProgressEvent>(event).id, "in-1");
    EXPECT_EQ(std::get<ProgressEvent>(event).byte_count, 1024u);
}

TEST_F(TransferEventParserTest, ParseCompleteVerificationStates) {
    auto plain = std::get<CompleteEvent>(parse_transfer_event("complete a"));
    EXPECT_FALSE(plain.verified.has_value());

    auto verified = std::get<CompleteEvent>(parse_transfer_event("complete a verified"));
    EXPECT_EQ(verified.verified, true);

    auto mismatch = std::get<CompleteEvent>(parse_transfer_event("complete a MISMATCH"));
    EXPECT_EQ(mismatch.verified, false);

    auto unknown = std::get<CompleteEvent>(parse_transfer_event("complete a unknown"));
    EXPECT_FALSE(unknown.verified.has_value());
}

TEST_F(TransferEventParserTest, ParseFailKeepsWholeReason) {
    auto event = parse_transfer_event("fail in-1 Connection reset by peer");

    ASSERT_TRUE(std::holds_alternative<FailEvent>(event));
    EXPECT_EQ(std::get<FailEvent>(event).reason, "Connection reset by peer");
}

TEST_F(TransferEventParserTest, ParseRemoteCancel) {
    auto event = parse_transfer_event("remote-cancel in-1");

    ASSERT_TRUE(std::holds_alternative<RemoteCancelEvent>(event));
    EXPECT_EQ(event_transfer_id(event), "in-1");
}

TEST_F(TransferEventParserTest, RejectsMalformedLines) {
    EXPECT_THROW(parse_transfer_event(""), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("teleport x"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("start sideways a 1 text/plain a.txt"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("start incoming a 1 text/plain"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("start incoming a -5 text/plain a.txt"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("start outgoing a 10 text/plain x a.txt"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("progress a"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("progress a 12abc"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("progress a 99999999999999999999999"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("complete a maybe"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("fail a"), std::invalid_argument);
    EXPECT_THROW(parse_transfer_event("remote-cancel"), std::invalid_argument);
}

TEST_F(TransferEventParserTest, EventKeywords) {
    EXPECT_TRUE(is_transfer_event_keyword("start"));
    EXPECT_TRUE(is_transfer_event_keyword("progress"));
    EXPECT_TRUE(is_transfer_event_keyword("complete"));
    EXPECT_TRUE(is_transfer_event_keyword("fail"));
    EXPECT_TRUE(is_transfer_event_keyword("remote-cancel"));
    EXPECT_FALSE(is_transfer_event_keyword("cancel"));
    EXPECT_FALSE(is_transfer_event_keyword("show"));
}

class TransferEventDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        TransferOptions options;
        options.dismiss_delay = 5s;
        manager_ = std::make_unique<TransferManager>(options, nullptr);
        dispatcher_ = std::make_unique<TransferEventDispatcher>(*manager_);
    }

    void TearDown() override {
        dispatcher_.reset();
        manager_.reset();
    }

    void dispatch(const std::string& line) {
        dispatcher_->dispatch(parse_transfer_event(line));
    }

    std::unique_ptr<TransferManager> manager_;
    std::unique_ptr<TransferEventDispatcher> dispatcher_;
};

TEST_F(TransferEventDispatcherTest, DrivesManagerThroughLifecycle) {
    dispatch("start incoming in-1 100 text/plain notes.txt");
    dispatch("progress in-1 40");

    auto session = manager_->session("in-1");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->bytes_transferred, 40u);

    dispatch("complete in-1 verified");

    session = manager_->session("in-1");
    EXPECT_EQ(session->status, TransferStatus(Completed{true}));
    EXPECT_EQ(session->bytes_transferred, 100u);
    EXPECT_EQ(dispatcher_->get_dispatched_count(), 3u);
}

TEST_F(TransferEventDispatcherTest, FailAndRemoteCancel) {
    dispatch("start outgoing a 100 text/plain 10 a.txt");
    dispatch("start outgoing b 100 text/plain 10 b.txt");

    dispatch("fail a Peer went away");
    dispatch("remote-cancel b");

    EXPECT_EQ(manager_->session("a")->status, TransferStatus(Failed{"Peer went away"}));
    EXPECT_EQ(manager_->session("b")->status, TransferStatus(Failed{CANCELLED_BY_RECEIVER}));
}

TEST_F(TransferEventDispatcherTest, CancelWithoutNotifierStillFails) {
    dispatch("start incoming a 100 text/plain a.txt");

    manager_->cancel_transfer("a");

    EXPECT_EQ(manager_->session("a")->status, TransferStatus(Failed{CANCELLED_BY_USER}));
}
