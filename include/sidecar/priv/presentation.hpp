#pragma once

#include <functional>
#include <string>

namespace sidecar {

    struct ViewOptions {
        enum class ContentKind {
            // `content` is an HTML document rendered in place
            Html,
            // `content` is a URL to navigate to
            Url
        };

        std::string id;
        std::string title;
        ContentKind contentKind{ContentKind::Url};
        std::string content;
        int width{800};
        int height{600};
        // 0 means unconstrained
        int minWidth{0};
        int minHeight{0};
        bool resizable{true};
        bool decorations{true};
        bool centered{false};
        // Shown as soon as it is created; otherwise wait for View::show().
        bool visible{true};
        // Invoked on the UI thread when the user closes the window (not on closeView()).
        std::function<void()> onUserClose{};
    };

    class View {
    public:
        virtual ~View() = default;

        virtual const std::string& id() const = 0;
        virtual void evaluateScript(const std::string& js) = 0;
        virtual void show() = 0;
    };

    // Window manager capability. Only ever touched from the UI thread.
    class PresentationLayer {
    public:
        virtual ~PresentationLayer() = default;

        // The returned view stays owned by the layer until closeView().
        // nullptr on failure, with the reason in `errorMessage`.
        virtual View* createView(const ViewOptions& options, std::string& errorMessage) = 0;
        virtual void closeView(View* view) = 0;

        // Best effort: errors are logged and otherwise ignored.
        void updateStatusText(View* view, const std::string& text);
        void showStatusError(View* view, const std::string& text, const std::string& color);
    };

    namespace splash {
        // Loading page with a `#status` element the launcher writes into.
        std::string html(const std::string& title);

        // Script setting `#status` text (and colour, if given).
        std::string statusScript(const std::string& text, const std::string& color = {});

        // Single-quoted JavaScript string literal.
        std::string quoteJavaScript(const std::string& s);
    }

}
