#pragma once

#include <functional>

namespace sidecar {
    class EventLoop;

    EventLoop* getEventLoop();
    void setEventLoop(EventLoop* eventLoop);

    // The foreground execution context. It owns every view; the readiness
    // thread only reaches views by posting tasks here.
    //
    // Call `initializeOnUIThread()` once, and `start()` to run the main UI message loop.
    // It will then go into infinite message loop until `stop()` is invoked by some event
    // (or externally invoked on another thread).
    //
    // Implement (derive from) this class and call `setEventLoop()` to replace it, before
    // invoking `initializeOnUIThread()` (or any other functions).
    //
    // The default implementation is based on choc (`choc::messageloop`).
    class EventLoop {
    protected:
        virtual void initializeOnUIThreadImpl() = 0;
        virtual void enqueueTaskOnMainThreadImpl(std::function<void()>&& func) = 0;
        virtual void startImpl() = 0;
        virtual void stopImpl() = 0;
    public:
        virtual ~EventLoop() = default;

        static void initializeOnUIThread() { getEventLoop()->initializeOnUIThreadImpl(); }
        // Enqueue task on the main thread to run asynchronously.
        static void enqueueTaskOnMainThread(std::function<void()>&& func) { getEventLoop()->enqueueTaskOnMainThreadImpl(std::move(func)); }
        static void start() { getEventLoop()->startImpl(); }
        static void stop() { getEventLoop()->stopImpl(); }
    };

}
