#include <cstdio>

#include <sidecar/sidecar.hpp>

namespace sidecar {

void PresentationLayer::updateStatusText(View* view, const std::string& text) {
    if (!view)
        return;
    try {
        view->evaluateScript(splash::statusScript(text));
    } catch (const std::exception& e) {
        Logger::global()->logDiagnostic("Could not update status on %s: %s", view->id().c_str(), e.what());
    }
}

void PresentationLayer::showStatusError(View* view, const std::string& text, const std::string& color) {
    if (!view)
        return;
    try {
        view->evaluateScript(splash::statusScript(text, color));
    } catch (const std::exception& e) {
        Logger::global()->logDiagnostic("Could not show error on %s: %s", view->id().c_str(), e.what());
    }
}

namespace splash {

std::string quoteJavaScript(const std::string& s) {
    std::string ret{"'"};
    for (unsigned char c : s) {
        switch (c) {
            case '\\': ret += "\\\\"; break;
            case '\'': ret += "\\'"; break;
            case '\n': ret += "\\n"; break;
            case '\r': ret += "\\r"; break;
            case '\t': ret += "\\t"; break;
            // keeps the literal safe inside an inline <script> too
            case '<': ret += "\\x3c"; break;
            case '>': ret += "\\x3e"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    ret += buf;
                } else
                    ret += static_cast<char>(c);
        }
    }
    ret += "'";
    return ret;
}

std::string statusScript(const std::string& text, const std::string& color) {
    std::string js = "document.getElementById('status').textContent = " + quoteJavaScript(text) + ";";
    if (!color.empty())
        js += "document.getElementById('status').style.color = " + quoteJavaScript(color) + ";";
    return js;
}

static std::string escapeHtml(const std::string& s) {
    std::string ret;
    for (char c : s) {
        switch (c) {
            case '&': ret += "&amp;"; break;
            case '<': ret += "&lt;"; break;
            case '>': ret += "&gt;"; break;
            case '"': ret += "&quot;"; break;
            default: ret += c;
        }
    }
    return ret;
}

std::string html(const std::string& title) {
    auto t = escapeHtml(title);
    return R"(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>)" + t + R"(</title>
<style>
  html, body { margin: 0; height: 100%; background: #111827; color: #e5e7eb;
               font-family: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, sans-serif;
               -webkit-user-select: none; user-select: none; cursor: default; }
  body { display: flex; flex-direction: column; align-items: center; justify-content: center; }
  h1 { font-size: 28px; font-weight: 600; margin: 0 0 24px 0; letter-spacing: 0.04em; }
  .spinner { width: 36px; height: 36px; border: 4px solid #374151; border-top-color: #60a5fa;
             border-radius: 50%; animation: spin 0.9s linear infinite; }
  #status { margin-top: 20px; font-size: 13px; color: #9ca3af; min-height: 1em; }
  @keyframes spin { to { transform: rotate(360deg); } }
</style>
</head>
<body>
  <h1>)" + t + R"(</h1>
  <div class="spinner"></div>
  <div id="status">Starting server...</div>
</body>
</html>
)";
}

} // namespace splash

}
