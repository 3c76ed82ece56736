#include <stdexcept>

#include <choc/gui/choc_WebView.h>
#include <choc/gui/choc_DesktopWindow.h>

#include <sidecar-gui/ChocPresentationLayer.hpp>

namespace sidecar::gui {

class ChocPresentationLayer::ChocView : public View {
    std::string viewId;
    std::unique_ptr<choc::ui::WebView> webview;
    choc::ui::DesktopWindow window;

public:
    ChocView(const ViewOptions& options, const Configuration& config)
        : viewId(options.id),
          window({ 100, 100, options.width, options.height }) {
        choc::ui::WebView::Options webOptions;
        webOptions.enableDebugMode = config.enableDebugger;
        webview = std::make_unique<choc::ui::WebView>(webOptions);
        if (!webview->loadedOK())
            throw std::runtime_error("WebView is not available on this system");

        window.setWindowTitle(options.title);
        window.setResizable(options.resizable);
        // choc has no borderless style; an undecorated window at least cannot be closed or resized
        if (!options.decorations)
            window.setClosable(false);
        if (options.minWidth > 0 && options.minHeight > 0)
            window.setMinimumSize(options.minWidth, options.minHeight);
        if (options.centered)
            window.centreWithSize(options.width, options.height);
        window.setContent(webview->getViewHandle());
        window.windowClosed = [onUserClose = options.onUserClose] {
            if (onUserClose)
                onUserClose();
        };

        bool loaded = options.contentKind == ViewOptions::ContentKind::Html
            ? webview->setHTML(options.content)
            : webview->navigate(options.content);
        if (!loaded)
            throw std::runtime_error("could not load content into view '" + viewId + "'");

        if (options.visible)
            show();
    }

    const std::string& id() const override { return viewId; }

    void evaluateScript(const std::string& js) override {
        if (!webview->evaluateJavascript(js))
            throw std::runtime_error("script evaluation failed");
    }

    void show() override {
        window.setVisible(true);
        window.toFront();
    }
};

ChocPresentationLayer::ChocPresentationLayer(Configuration config)
    : config(config) {
}

ChocPresentationLayer::~ChocPresentationLayer() = default;

View* ChocPresentationLayer::createView(const ViewOptions& options, std::string& errorMessage) {
    if (views.contains(options.id)) {
        errorMessage = "view '" + options.id + "' already exists";
        return nullptr;
    }
    try {
        auto view = std::make_unique<ChocView>(options, config);
        auto ret = view.get();
        views[options.id] = std::move(view);
        return ret;
    } catch (const std::exception& e) {
        errorMessage = e.what();
        return nullptr;
    }
}

void ChocPresentationLayer::closeView(View* view) {
    if (!view)
        return;
    auto id = view->id();
    views.erase(id);
}

} // namespace sidecar::gui
