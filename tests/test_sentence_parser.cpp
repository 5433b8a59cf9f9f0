/**
 * @file test_sentence_parser.cpp
 * @brief Tests for incremental sentence segmentation
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "voxstream/streaming/sentence_parser.h"

using voxstream::EventEmitter;
using voxstream::EventType;
using voxstream::StreamingEvent;
using voxstream::streaming::ParserConfig;
using voxstream::streaming::SentenceParser;
using voxstream::streaming::TextChunk;

namespace {

ParserConfig config_with_min(int32_t min_chunk_length) {
    ParserConfig config;
    config.min_chunk_length = min_chunk_length;
    return config;
}

std::vector<TextChunk> run_parser(const std::string& text, const ParserConfig& config,
                                  size_t delta_size) {
    SentenceParser parser(config);
    std::vector<TextChunk> out;
    for (size_t pos = 0; pos < text.size(); pos += delta_size) {
        auto chunks = parser.add_chunk(text.substr(pos, delta_size));
        out.insert(out.end(), chunks.begin(), chunks.end());
    }
    TextChunk last;
    if (parser.finalize(last)) {
        out.push_back(last);
    }
    return out;
}

std::vector<std::string> texts_of(const std::vector<TextChunk>& chunks) {
    std::vector<std::string> texts;
    for (const auto& chunk : chunks) {
        if (!chunk.text.empty()) {
            texts.push_back(chunk.text);
        }
    }
    return texts;
}

std::vector<std::string> split(const std::string& text, int32_t min_chunk_length = 10) {
    return texts_of(run_parser(text, config_with_min(min_chunk_length), text.size() + 1));
}

const std::vector<std::string> kSamples = {
    "Hello Mr. Smith.",
    "Pi is 3.14. Great!",
    "J.K. Rowling wrote it.",
    "I think... maybe.",
    "Hi. How are you?",
    "First sentence here. Second sentence here! Third one?",
    "He said \"stop.\" Then he left. Really?! Yes.",
    "Wait...? No way. Dr. Jones, e.g. the surgeon, arrived at 5.30 p.m. today.",
    "She said \xE2\x80\x9Cgo.\xE2\x80\x9D Then she left (quietly.) The end",
    "So do I. Then we go.\n\nNew paragraph starts here. Visit example.com now.",
    "   Leading spaces. Trailing words without punctuation",
    "Hello there friend. \n",
    "Two short lines.\n\n  ",
};

}  // namespace

// =============================================================================
// BOUNDARY DETECTION
// =============================================================================

TEST(SentenceParser, AbbreviationIsNotBoundary) {
    EXPECT_EQ(split("Hello Mr. Smith."), std::vector<std::string>({"Hello Mr. Smith."}));
}

TEST(SentenceParser, DecimalIsNotBoundary) {
    EXPECT_EQ(split("Pi is 3.14. Great!"), std::vector<std::string>({"Pi is 3.14.", "Great!"}));
}

TEST(SentenceParser, InitialsAreNotBoundary) {
    EXPECT_EQ(split("J.K. Rowling wrote it."),
              std::vector<std::string>({"J.K. Rowling wrote it."}));
}

TEST(SentenceParser, EllipsisIsNotBoundary) {
    EXPECT_EQ(split("I think... maybe."), std::vector<std::string>({"I think... maybe."}));
}

TEST(SentenceParser, ShortChunkMergesWithNext) {
    EXPECT_EQ(split("Hi. How are you?", 10), std::vector<std::string>({"Hi. How are you?"}));
}

TEST(SentenceParser, ShortChunksAccumulateUntilLongEnough) {
    EXPECT_EQ(split("Yes. No. Maybe so, friend. End.", 15),
              std::vector<std::string>({"Yes. No. Maybe so, friend.", "End."}));
}

TEST(SentenceParser, AbbreviationMatchIsCaseInsensitive) {
    EXPECT_EQ(split("See DR. Who now.", 0), std::vector<std::string>({"See DR. Who now."}));
}

TEST(SentenceParser, DottedAbbreviation) {
    EXPECT_EQ(split("Fruits, e.g. apples, are good. Eat them.", 0),
              std::vector<std::string>({"Fruits, e.g. apples, are good.", "Eat them."}));
}

TEST(SentenceParser, PronounIEndsSentence) {
    EXPECT_EQ(split("So do I. Then we go.", 0),
              std::vector<std::string>({"So do I.", "Then we go."}));
}

TEST(SentenceParser, PunctuationRunIsOneBoundary) {
    EXPECT_EQ(split("Really?! Yes.", 0), std::vector<std::string>({"Really?!", "Yes."}));
    EXPECT_EQ(split("Wait...? No way.", 0), std::vector<std::string>({"Wait...?", "No way."}));
}

TEST(SentenceParser, ClosingQuoteStaysWithSentence) {
    EXPECT_EQ(split("He said \"stop.\" Then he left.", 0),
              std::vector<std::string>({"He said \"stop.\"", "Then he left."}));
    EXPECT_EQ(split("She said \xE2\x80\x9Cgo.\xE2\x80\x9D Then left.", 0),
              std::vector<std::string>(
                  {"She said \xE2\x80\x9Cgo.\xE2\x80\x9D", "Then left."}));
}

TEST(SentenceParser, PeriodInsideWordIsNotBoundary) {
    EXPECT_EQ(split("Visit example.com today. Thanks.", 0),
              std::vector<std::string>({"Visit example.com today.", "Thanks."}));
}

TEST(SentenceParser, CustomAbbreviationList) {
    ParserConfig config = config_with_min(0);
    config.abbreviations = {"approx."};
    auto chunks = texts_of(run_parser("Mr. Smith waited approx. ten minutes.", config, 64));
    EXPECT_EQ(chunks, std::vector<std::string>({"Mr.", "Smith waited approx. ten minutes."}));
}

TEST(SentenceParser, BlankLineBoundaryWhenEnabled) {
    ParserConfig config = config_with_min(0);
    config.break_on_blank_line = true;
    auto chunks = texts_of(run_parser("Title\n\nBody text here.", config, 64));
    EXPECT_EQ(chunks, std::vector<std::string>({"Title", "Body text here."}));

    config.break_on_blank_line = false;
    chunks = texts_of(run_parser("Title\n\nBody text here.", config, 64));
    EXPECT_EQ(chunks, std::vector<std::string>({"Title\n\nBody text here."}));
}

// =============================================================================
// INCREMENTAL BEHAVIOR
// =============================================================================

TEST(SentenceParser, EmitsCompletedSentencesImmediately) {
    SentenceParser parser(config_with_min(0));

    EXPECT_TRUE(parser.add_chunk("Hello there").empty());
    // Undecided until the next character arrives
    EXPECT_TRUE(parser.add_chunk(".").empty());

    auto chunks = parser.add_chunk(" How");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text, "Hello there.");
    EXPECT_EQ(chunks[0].sequence_number, 0);
}

TEST(SentenceParser, FinalizeFlushesUnpunctuatedRemainder) {
    SentenceParser parser(config_with_min(0));
    auto chunks = parser.add_chunk("One. Two without end");
    ASSERT_EQ(chunks.size(), 1u);

    TextChunk last;
    ASSERT_TRUE(parser.finalize(last));
    EXPECT_EQ(last.text, "Two without end");
    EXPECT_EQ(last.raw_text, " Two without end");
    EXPECT_EQ(last.sequence_number, 1);
}

TEST(SentenceParser, FinalizeTwiceReturnsNothing) {
    SentenceParser parser;
    parser.add_chunk("Some words");

    TextChunk chunk;
    EXPECT_TRUE(parser.finalize(chunk));
    EXPECT_FALSE(parser.finalize(chunk));
    EXPECT_TRUE(parser.finalized());
    EXPECT_TRUE(parser.add_chunk("More text. And more.").empty());
}

TEST(SentenceParser, WhitespaceOnlyRemainderKeepsRawText) {
    SentenceParser parser(config_with_min(0));
    auto chunks = parser.add_chunk("Done. \n  ");
    ASSERT_EQ(chunks.size(), 1u);

    TextChunk chunk;
    ASSERT_TRUE(parser.finalize(chunk));
    EXPECT_TRUE(chunk.text.empty());
    EXPECT_EQ(chunk.raw_text, " \n  ");
    EXPECT_EQ(chunk.sequence_number, voxstream::kNoSequence);
    EXPECT_EQ(parser.next_sequence_number(), 1);
}

TEST(SentenceParser, EmptyRemainderReturnsNothing) {
    SentenceParser parser(config_with_min(0));
    parser.add_chunk("Done.");

    TextChunk chunk;
    ASSERT_TRUE(parser.finalize(chunk));
    EXPECT_EQ(chunk.text, "Done.");

    SentenceParser empty;
    EXPECT_FALSE(empty.finalize(chunk));
}

TEST(SentenceParser, SequenceNumbersStartAtConfiguredValue) {
    ParserConfig config = config_with_min(0);
    config.first_sequence_number = 5;
    SentenceParser parser(config);

    auto chunks = parser.add_chunk("A b c. D e f. G");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].sequence_number, 5);
    EXPECT_EQ(chunks[1].sequence_number, 6);
    EXPECT_EQ(parser.next_sequence_number(), 7);
}

TEST(SentenceParser, ResetRestartsNumberingAndClearsBuffer) {
    SentenceParser parser(config_with_min(0));
    parser.add_chunk("First one. Partial");
    EXPECT_GT(parser.buffered_length(), 0u);

    parser.reset();
    EXPECT_EQ(parser.buffered_length(), 0u);
    EXPECT_EQ(parser.next_sequence_number(), 0);

    auto chunks = parser.add_chunk("Again here. ");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].sequence_number, 0);
    EXPECT_EQ(chunks[0].text, "Again here.");
}

TEST(SentenceParser, BufferOverflowFailsParser) {
    ParserConfig config = config_with_min(0);
    config.max_buffer_length = 20;

    std::vector<StreamingEvent> events;
    SentenceParser parser(config, EventEmitter("s1", [&events](const StreamingEvent& event) {
                              events.push_back(event);
                          }));

    EXPECT_TRUE(parser.add_chunk("this text never ends with any punctuation").empty());
    EXPECT_TRUE(parser.failed());
    EXPECT_EQ(parser.last_error(), VXS_ERROR_PARSE_BUFFER_OVERFLOW);

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, EventType::ParseBufferOverflow);
    EXPECT_EQ(events.back().session_id, "s1");

    EXPECT_TRUE(parser.add_chunk("More. Text.").empty());
    TextChunk chunk;
    EXPECT_FALSE(parser.finalize(chunk));
}

TEST(SentenceParser, ChunkDetectedEventsCarrySequenceNumbers) {
    std::vector<StreamingEvent> events;
    SentenceParser parser(config_with_min(0),
                          EventEmitter("s2", [&events](const StreamingEvent& event) {
                              events.push_back(event);
                          }));
    parser.add_chunk("One here. Two here. ");

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, EventType::ChunkDetected);
    EXPECT_EQ(events[0].sequence_number, 0);
    EXPECT_EQ(events[1].sequence_number, 1);
    EXPECT_EQ(events[1].detail, "Two here.");
}

// =============================================================================
// PROPERTIES
// =============================================================================

TEST(SentenceParser, StreamingInvariance) {
    for (int32_t min_length : {0, 10, 25}) {
        ParserConfig config = config_with_min(min_length);
        config.break_on_blank_line = (min_length == 0);
        for (const auto& sample : kSamples) {
            auto whole = texts_of(run_parser(sample, config, sample.size() + 1));
            for (size_t delta : {1u, 2u, 3u, 7u}) {
                EXPECT_EQ(texts_of(run_parser(sample, config, delta)), whole)
                    << "delta=" << delta << " min=" << min_length << " text=" << sample;
            }
        }
    }
}

TEST(SentenceParser, RawTextRoundTrips) {
    for (const auto& sample : kSamples) {
        for (size_t delta : {1u, 5u, 1000u}) {
            std::string joined;
            for (const auto& chunk : run_parser(sample, config_with_min(0), delta)) {
                joined += chunk.raw_text;
            }
            EXPECT_EQ(joined, sample) << "delta=" << delta;
        }
    }
}

TEST(SentenceParser, TextIsTrimmedRaw) {
    auto chunks = run_parser("   Leading spaces. Next one.", config_with_min(0), 100);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].raw_text, "   Leading spaces.");
    EXPECT_EQ(chunks[0].text, "Leading spaces.");
    EXPECT_EQ(chunks[1].raw_text, " Next one.");
    EXPECT_EQ(chunks[1].text, "Next one.");
}
