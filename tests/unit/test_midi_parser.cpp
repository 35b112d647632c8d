#include <gtest/gtest.h>
#include "MidiParser.hpp"
#include "MidiEvent.hpp"
#include <vector>

using namespace tender;

class MidiParserTest : public ::testing::Test {
protected:
    void feed(std::vector<uint8_t> bytes, uint32_t offset = 0) {
        parser.parse(bytes.data(), bytes.size(), offset, [this](const MidiEvent& e) {
            events.push_back(e);
        });
    }

    MidiParser parser;
    std::vector<MidiEvent> events;
};

TEST_F(MidiParserTest, NoteOn) {
    feed({0x90, 0x3C, 0x64}, 17);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].status, 0x90);
    EXPECT_EQ(events[0].data1, 0x3C);
    EXPECT_EQ(events[0].data2, 0x64);
    EXPECT_EQ(events[0].sampleOffset, 17u);
    EXPECT_TRUE(events[0].isNoteOn());
}

TEST_F(MidiParserTest, RunningStatus) {
    feed({0x91, 0x3C, 0x64, 0x40, 0x50, 0x43, 0x00});
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].status, 0x91);
    EXPECT_EQ(events[1].data1, 0x40);
    EXPECT_EQ(events[1].getChannel(), 1);
    // Velocity zero under running status is a note off
    EXPECT_TRUE(events[2].isNoteOff());
}

TEST_F(MidiParserTest, MessageSplitAcrossCalls) {
    feed({0x80, 0x3C});
    EXPECT_TRUE(events.empty());
    feed({0x40});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].isNoteOff());
}

TEST_F(MidiParserTest, RealTimeBytesInterleave) {
    feed({0x90, 0xF8, 0x3C, 0xFE, 0x64});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data1, 0x3C);
    EXPECT_EQ(events[0].data2, 0x64);
}

TEST_F(MidiParserTest, SysExIsSkipped) {
    feed({0xF0, 0x7E, 0x01, 0x02, 0xF7, 0x90, 0x3C, 0x64});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].status, 0x90);
}

TEST_F(MidiParserTest, SystemCommonCancelsRunningStatus) {
    feed({0x90, 0x3C, 0x64, 0xF0, 0x01, 0xF7, 0x3E, 0x64});
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(MidiParserTest, StrayDataBytesAreIgnored) {
    feed({0x3C, 0x64, 0x90, 0x3C, 0x64});
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(MidiParserTest, SingleDataByteMessages) {
    feed({0xC0, 0x05, 0x06, 0xD2, 0x40});
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].data1, 0x05);
    EXPECT_EQ(events[1].data1, 0x06);
    EXPECT_EQ(events[2].status, 0xD2);
    EXPECT_EQ(events[2].data2, 0);
}

TEST_F(MidiParserTest, ResetDropsPartialMessage) {
    feed({0x90, 0x3C});
    parser.reset();
    feed({0x64});
    EXPECT_TRUE(events.empty());
}

TEST(NoteEventTest, FromMidi) {
    auto on = to_note_event({0x90, 60, 127, 42});
    EXPECT_EQ(on.type, NoteEvent::Type::NoteOn);
    EXPECT_EQ(on.note, 60);
    EXPECT_FLOAT_EQ(on.velocity, 1.0f);
    EXPECT_EQ(on.timing, 42u);

    auto soft = to_note_event({0x93, 61, 1, 0});
    EXPECT_FLOAT_EQ(soft.velocity, 1.0f / 127.0f);

    EXPECT_EQ(to_note_event({0x80, 60, 64, 0}).type, NoteEvent::Type::NoteOff);
    EXPECT_EQ(to_note_event({0x90, 60, 0, 0}).type, NoteEvent::Type::NoteOff);

    auto cc = to_note_event({0xB0, 7, 100, 9});
    EXPECT_EQ(cc.type, NoteEvent::Type::Ignored);
    EXPECT_EQ(cc.timing, 9u);
}

TEST(MidiParserFeedTest, ReturnsEventOnLastByte) {
    MidiParser parser;
    EXPECT_FALSE(parser.feed(0xB0, 0).has_value());
    EXPECT_FALSE(parser.feed(0x07, 0).has_value());
    auto event = parser.feed(0x64, 3);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->status, 0xB0);
    EXPECT_EQ(event->sampleOffset, 3u);
}
