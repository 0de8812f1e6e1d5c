#include <csignal>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Wikipath {
namespace Engine {

using namespace Wikipath::Core;

Crawler::~Crawler() {
    shutdown();
}

void Crawler::log_setup() const {
    Logger::debug("Crawler: will start at \"" + start_ + "\" and stop at \"" + target_ + "\"");
    Logger::debug("Crawler: " + std::to_string(num_workers_) + " workers, "
                  + std::to_string(fetch_limiter_.available()) + " concurrent fetches, "
                  + std::to_string(num_threads_) + " IO threads");

    if (keywords_.empty())
        return;
    std::string listing;
    for (size_t i = 0; i < keywords_.size(); ++i) {
        listing += "\n\t" + std::to_string(i) + ") " + keywords_[i];
    }
    Logger::debug("Crawler: prioritizing links by keywords:" + listing);
}

void Crawler::init_io_services() {
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < num_threads_; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
                record_failure(std::current_exception());
                trigger_done();
            }
        });
    }
}

void Crawler::init_signals() {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::warn("Signal " + std::to_string(signal_number) + " received. Stopping crawl...");
            cancel();
        }
    });
}

void Crawler::await_completion() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_.load(); });
}

void Crawler::trigger_done() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void Crawler::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    boost::system::error_code ec;
    signals_.cancel(ec);

    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
            continue;
        }
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();
}

}  // namespace Engine
}  // namespace Wikipath
