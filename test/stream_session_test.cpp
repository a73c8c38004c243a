#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "stream_session.hpp"

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace sluice;
using ::testing::ElementsAre;

class StreamSessionTest : public ::testing::Test {
protected:
    asio::io_context ios_;
    piece_catalog catalog_ = piece_catalog::from_layout(20 * 1024, 1024);

    // window of 4, header of two pieces, footer of one
    static scheduler_settings settings() {
        scheduler_settings s;
        s.window_size = 4;
        s.header_size = 2 * 1024;
        s.footer_size = 1024;
        s.possible_footer_size = 1024;
        return s;
    }
};

TEST_F(StreamSessionTest, ConstructionPinsHeaderAndSendsWindow) {
    stream_session session(ios_, catalog_, settings());
    ASSERT_EQ(session.priority_table().pinned_pieces(), piece_range(0, 1));
    ASSERT_EQ(session.priority_table().num_commands(), 1);
    ASSERT_THAT(session.priority_table().wanted_pieces(), ElementsAre(0, 1, 2, 3));
    ASSERT_EQ(session.priority_table().priority(10), piece_priority::ignore);
    // nothing is posted on construction
    ASSERT_EQ(ios_.run(), 0);
}

TEST_F(StreamSessionTest, EventsAreHandledOnIoContext) {
    stream_session session(ios_, catalog_, settings());

    session.piece_finished(0);
    // the state is published right away, the scheduler learns about it later
    ASSERT_TRUE(catalog_.is_finished(0));
    ASSERT_FALSE(session.priority_table().has(0));
    ASSERT_THAT(session.scheduler().active_pieces(), ElementsAre(0, 1, 2, 3));

    ASSERT_EQ(ios_.run(), 1);
    ASSERT_TRUE(session.priority_table().has(0));
    ASSERT_THAT(session.scheduler().active_pieces(), ElementsAre(1, 2, 3, 4));
    ASSERT_THAT(session.priority_table().wanted_pieces(), ElementsAre(1, 2, 3, 4));
}

TEST_F(StreamSessionTest, SeekToOffsetMovesWindow) {
    stream_session session(ios_, catalog_, settings());

    session.seek_to_offset(10 * 1024 + 5);
    ASSERT_THAT(session.scheduler().active_pieces(), ElementsAre(0, 1, 2, 3));
    ios_.run();
    ASSERT_THAT(session.scheduler().active_pieces(), ElementsAre(10, 11, 12, 13, 19));
    ASSERT_THAT(session.priority_table().wanted_pieces(), ElementsAre(10, 11, 12, 13, 19));
    // header stays pinned even though the window moved away from it
    ASSERT_EQ(session.priority_table().priority(0), piece_priority::top);

    ios_.restart();
    session.resume();
    ios_.run();
    ASSERT_THAT(session.scheduler().active_pieces(), ElementsAre(0, 1, 2, 3, 19));
}

TEST_F(StreamSessionTest, InvalidArgumentsThrowOnCallingThread) {
    stream_session session(ios_, catalog_, settings());

    ASSERT_THROW(session.piece_finished(20), std::out_of_range);
    ASSERT_THROW(session.piece_failed(-1), std::out_of_range);
    ASSERT_THROW(session.seek(25), std::out_of_range);
    ASSERT_THROW(session.seek_to_offset(20 * 1024), std::out_of_range);
    ASSERT_EQ(ios_.run(), 0);
}

TEST_F(StreamSessionTest, FailedPieceCanBePickedAgain) {
    stream_session session(ios_, catalog_, settings());

    ASSERT_EQ(session.priority_table().pick(), 0);
    session.piece_failed(0);
    ASSERT_EQ(catalog_.state(0), piece_state::failed);
    ios_.run();
    ASSERT_FALSE(session.priority_table().is_reserved(0));
    ASSERT_EQ(session.priority_table().pick(), 0);
    ASSERT_EQ(session.stats().num_failed_pieces, 1);
}

TEST_F(StreamSessionTest, EmptyFileIsNoop) {
    piece_catalog empty;
    stream_session session(ios_, empty, settings());

    ASSERT_NO_THROW(session.piece_finished(3));
    ASSERT_NO_THROW(session.seek(1));
    ASSERT_NO_THROW(session.seek_to_offset(100));
    session.resume();
    ios_.run();
    ASSERT_TRUE(session.stats().is_finished());
    ASSERT_TRUE(session.scheduler().active_pieces().empty());
}

TEST_F(StreamSessionTest, MeasuresDownloadRate) {
    stream_session session(ios_, catalog_, settings());
    ASSERT_EQ(session.stats().download_rate, 0);

    for(piece_index_t i = 0; i < 4; ++i) {
        session.piece_finished(i);
    }
    ios_.run();
    // the rate is recalculated once a full second has elapsed
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    const auto stats = session.stats();
    ASSERT_GT(stats.download_rate, 0);
    ASSERT_LE(stats.download_rate, 4 * 1024);
}

TEST_F(StreamSessionTest, DownloadsWholeFileAcrossThreads) {
    stream_session session(ios_, catalog_, settings());
    auto work = asio::make_work_guard(ios_);
    std::thread network([this] { ios_.run(); });

    std::thread engine([&session] {
        for(piece_index_t i = 0; i < 20; ++i) {
            session.piece_finished(i);
        }
    });
    std::thread player([&session] {
        session.seek(12);
        session.resume();
        session.seek_to_offset(5000);
    });
    engine.join();
    player.join();
    work.reset();
    network.join();

    const auto stats = session.stats();
    ASSERT_TRUE(stats.is_finished());
    ASSERT_EQ(stats.downloaded_bytes, 20 * 1024);
    ASSERT_TRUE(session.priority_table().has_all_pieces());
    ASSERT_TRUE(session.scheduler().active_pieces().empty());
}
