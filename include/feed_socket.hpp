#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "config.hpp"
#include "types.hpp"

/**
 * @class IFeedSocket
 * @brief An abstract subscription socket delivering whole compressed frames.
 *
 * Implementations report connection hiccups during poll/receive as TransientIOError.
 */
class IFeedSocket {

    public:
        virtual ~IFeedSocket() = default;

        /**
         * @brief Connects to the feed and subscribes to every topic.
         * @throws StartupError when the endpoint cannot be used at all.
         */
        virtual void open() = 0;

        /**
         * @brief Waits up to timeout for a frame to become readable.
         * @return true when receive() will not block.
         */
        virtual bool poll(std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Reads one frame. Returns std::nullopt when nothing was pending after all.
         */
        virtual std::optional<RawFrame> receive() = 0;

        /**
         * @brief Closes the socket and releases the feed context.
         */
        virtual void close() = 0;

        virtual std::string endpoint() const = 0;
};

using FeedSocketFactory = std::function<std::unique_ptr<IFeedSocket>()>;
