#include <gtest/gtest.h>

#include <sidecar/sidecar.hpp>

#include "fakes/RecordingPresentationLayer.hpp"

using sidecar::test::RecordingPresentationLayer;
namespace splash = sidecar::splash;

TEST(SplashScriptTest, QuoteJavaScript) {
    EXPECT_EQ("'Almost ready...'", splash::quoteJavaScript("Almost ready..."));
    EXPECT_EQ("''", splash::quoteJavaScript(""));
    EXPECT_EQ(R"('it\'s')", splash::quoteJavaScript("it's"));
    EXPECT_EQ(R"('a\\b')", splash::quoteJavaScript("a\\b"));
    EXPECT_EQ(R"('line\nbreak\r\ttab')", splash::quoteJavaScript("line\nbreak\r\ttab"));
    EXPECT_EQ(R"('\x3c/script\x3e')", splash::quoteJavaScript("</script>"));
    EXPECT_EQ(R"('\x01')", splash::quoteJavaScript("\x01"));
    // UTF-8 passes through untouched
    EXPECT_EQ("'\xE2\x9C\x93'", splash::quoteJavaScript("\xE2\x9C\x93"));
}

TEST(SplashScriptTest, StatusScriptWithoutColorLeavesStyleAlone) {
    auto js = splash::statusScript("Starting server...");
    EXPECT_EQ("document.getElementById('status').textContent = 'Starting server...';", js);
}

TEST(SplashScriptTest, StatusScriptWithColor) {
    auto js = splash::statusScript("Failed to start. Please restart the app.", "#ef4444");
    EXPECT_NE(std::string::npos, js.find("textContent = 'Failed to start. Please restart the app.'"));
    EXPECT_NE(std::string::npos, js.find("style.color = '#ef4444'"));
}

TEST(SplashScriptTest, HtmlHasStatusElementAndEscapedTitle) {
    auto page = splash::html("A <b> & C");
    EXPECT_NE(std::string::npos, page.find(R"(<div id="status">Starting server...</div>)"));
    EXPECT_NE(std::string::npos, page.find("A &lt;b&gt; &amp; C"));
    EXPECT_EQ(std::string::npos, page.find("A <b>"));
}

TEST(SplashScriptTest, StatusHelpersTolerateMissingOrBrokenViews) {
    RecordingPresentationLayer presentation{};
    std::string error;
    sidecar::ViewOptions options{};
    options.id = "splash";
    auto view = presentation.createView(options, error);
    ASSERT_NE(nullptr, view);

    presentation.updateStatusText(nullptr, "ignored");
    presentation.updateStatusText(view, "Starting server...");
    presentation.failingScripts = true;
    EXPECT_NO_THROW(presentation.updateStatusText(view, "Almost ready..."));
    EXPECT_NO_THROW(presentation.showStatusError(view, "Failed", "#ef4444"));

    ASSERT_EQ(1u, presentation.find("splash")->scripts.size());
}
