#pragma once

#include <map>
#include <memory>
#include <string>

#include <sidecar/sidecar.hpp>

namespace sidecar::gui {

// choc WebView inside a choc DesktopWindow, one per view.
class ChocPresentationLayer : public PresentationLayer {
public:
    struct Configuration {
        bool enableDebugger{false};
    };

    class ChocView;

    explicit ChocPresentationLayer(Configuration config = {});
    ~ChocPresentationLayer() override;

    View* createView(const ViewOptions& options, std::string& errorMessage) override;
    void closeView(View* view) override;

private:
    Configuration config;
    std::map<std::string, std::unique_ptr<ChocView>> views{};
};

} // namespace sidecar::gui
