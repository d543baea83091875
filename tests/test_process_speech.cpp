#include <doctest/doctest.h>
#include <chrono>
#include <vector>
#include "process_speech.hpp"

using namespace akka;

template <class T>
static bool settle(std::future<T>& f) {
    return f.wait_for(std::chrono::seconds(10)) == std::future_status::ready;
}

TEST_CASE("Command templates split on whitespace before substitution") {
    auto argv = expand_command("espeak-ng  -v {voice} -s {wpm}\t{text}",
                               {{"{voice}", "zh-TW"}, {"{wpm}", "175"}, {"{text}", "你好 世界"}});
    REQUIRE(argv.size() == 6);
    CHECK(argv[0] == "espeak-ng");
    CHECK(argv[2] == "zh-TW");
    CHECK(argv[4] == "175");
    CHECK(argv[5] == "你好 世界");
}

TEST_CASE("Placeholders inside a word and repeated placeholders") {
    auto argv = expand_command("--file={wav} {wav}", {{"{wav}", "/tmp/a.wav"}});
    REQUIRE(argv.size() == 2);
    CHECK(argv[0] == "--file=/tmp/a.wav");
    CHECK(argv[1] == "/tmp/a.wav");
}

TEST_CASE("A placeholder is not rescanned inside its own value") {
    auto argv2 = expand_command("say {text}", {{"{text}", "{text}{text}"}});
    CHECK(argv2[1] == "{text}{text}");
}

TEST_CASE("Empty templates give no argv") {
    CHECK(expand_command("", {}).empty());
    CHECK(expand_command("   \t ", {}).empty());
}

TEST_CASE("Speech rate maps to words per minute") {
    CHECK(rate_to_wpm(0.5f) == 175);
    CHECK(rate_to_wpm(1.0f) == 350);
    CHECK(rate_to_wpm(0.0f) == 80);
    CHECK(rate_to_wpm(5.0f) == 450);
}

TEST_CASE("Recognizer returns the trimmed stdout of the engine") {
    ProcessRecognizerConfig cfg;
    cfg.command = "printf 你好\\n";
    ProcessRecognizer stt(cfg);

    REQUIRE(stt.start_capture());
    std::vector<int16_t> audio(1600, 10);
    stt.append_audio(audio.data(), audio.size());
    CHECK(stt.buffered_samples() == 1600);

    auto fut = stt.finalize({"羊毛"});
    REQUIRE(settle(fut));
    auto r = fut.get();
    REQUIRE(r.ok);
    CHECK(r.value.text == "你好");
    CHECK(stt.buffered_samples() == 0);
}

TEST_CASE("Recognizer failures") {
    SUBCASE("no audio") {
        ProcessRecognizer stt;
        REQUIRE(stt.start_capture());
        auto fut = stt.finalize({});
        REQUIRE(settle(fut));
        auto r = fut.get();
        CHECK_FALSE(r.ok);
        CHECK(r.error == ErrorKind::TranscriptionEmpty);
    }
    SUBCASE("engine exits non-zero") {
        ProcessRecognizerConfig cfg;
        cfg.command = "false {wav}";
        ProcessRecognizer stt(cfg);
        REQUIRE(stt.start_capture());
        int16_t s[4] = {1, 2, 3, 4};
        stt.append_audio(s, 4);
        auto fut = stt.finalize({});
        REQUIRE(settle(fut));
        auto r = fut.get();
        CHECK_FALSE(r.ok);
        CHECK(r.error == ErrorKind::TranscriptionEmpty);
    }
    SUBCASE("engine missing") {
        ProcessRecognizerConfig cfg;
        cfg.command = "akka-no-such-recognizer {wav}";
        ProcessRecognizer stt(cfg);
        REQUIRE(stt.start_capture());
        int16_t s[4] = {1, 2, 3, 4};
        stt.append_audio(s, 4);
        auto fut = stt.finalize({});
        REQUIRE(settle(fut));
        CHECK_FALSE(fut.get().ok);
    }
}

TEST_CASE("Audio is only buffered while capturing") {
    ProcessRecognizer stt;
    int16_t s[4] = {1, 2, 3, 4};
    stt.append_audio(s, 4);
    CHECK(stt.buffered_samples() == 0);

    REQUIRE(stt.start_capture());
    stt.append_audio(s, 4);
    stt.abort();
    CHECK(stt.buffered_samples() == 0);
    stt.append_audio(s, 4);
    CHECK(stt.buffered_samples() == 0);
}

TEST_CASE("Synthesizer outcome follows the engine exit status") {
    SUBCASE("finished") {
        ProcessSynthesizerConfig cfg;
        cfg.command = "true {text}";
        ProcessSynthesizer tts(cfg);
        auto fut = tts.speak("你好", "zh-TW", 0.5f);
        REQUIRE(settle(fut));
        CHECK(fut.get() == SpeechOutcome::Finished);
    }
    SUBCASE("failed") {
        ProcessSynthesizerConfig cfg;
        cfg.command = "false {text}";
        ProcessSynthesizer tts(cfg);
        auto fut = tts.speak("你好", "zh-TW", 0.5f);
        REQUIRE(settle(fut));
        CHECK(fut.get() == SpeechOutcome::Failed);
    }
    SUBCASE("engine missing") {
        ProcessSynthesizerConfig cfg;
        cfg.command = "akka-no-such-synth {text}";
        ProcessSynthesizer tts(cfg);
        auto fut = tts.speak("x", "zh-TW", 0.5f);
        REQUIRE(settle(fut));
        CHECK(fut.get() == SpeechOutcome::Failed);
    }
}

TEST_CASE("cancel stops a long utterance") {
    ProcessSynthesizerConfig cfg;
    cfg.command = "sleep 30";
    ProcessSynthesizer tts(cfg);
    auto fut = tts.speak("a very long answer", "zh-TW", 0.5f);
    CHECK(fut.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);

    tts.cancel();
    REQUIRE(settle(fut));
    CHECK(fut.get() == SpeechOutcome::Cancelled);
}

TEST_CASE("cancel escalates to SIGKILL and returns only once the engine is gone") {
    ProcessSynthesizerConfig cfg;
    cfg.command = "sh -c {text}";
    cfg.stop_grace_ms = 200;
    ProcessSynthesizer tts(cfg);
    auto fut = tts.speak("trap '' TERM; exec sleep 30", "zh-TW", 0.5f);
    CHECK(fut.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout);

    const auto t0 = std::chrono::steady_clock::now();
    tts.cancel();
    const auto took = std::chrono::steady_clock::now() - t0;
    CHECK(took < std::chrono::seconds(2));

    REQUIRE(fut.wait_for(std::chrono::milliseconds(500)) == std::future_status::ready);
    CHECK(fut.get() == SpeechOutcome::Cancelled);
}
