#pragma once

#include "ports/output/IEventBus.hpp"
#include <ICommand.hpp>
#include <ThreadSafeQueue.hpp>
#include <unordered_map>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <iostream>

namespace accounting::adapters::secondary {

/**
 * @brief Доставка одного события зафиксированному списку обработчиков
 */
class DispatchEventCommand : public ICommand {
public:
    DispatchEventCommand(
        std::shared_ptr<const domain::DomainEvent> event,
        std::vector<ports::output::EventHandler> handlers
    ) : event_(std::move(event)), handlers_(std::move(handlers)) {}

    void execute() override {
        for (const auto& handler : handlers_) {
            try {
                handler(*event_);
            } catch (const std::exception& e) {
                std::cerr << "[InMemoryEventBus] Handler for " << event_->eventType
                          << " failed: " << e.what() << std::endl;
            }
        }
    }

    const char* name() const override {
        return event_->eventType.c_str();
    }

private:
    std::shared_ptr<const domain::DomainEvent> event_;
    std::vector<ports::output::EventHandler> handlers_;
};

/**
 * @brief In-memory событийная шина с асинхронной доставкой
 *
 * publish() копирует событие и текущий список подписчиков в команду и
 * кладёт её в ThreadSafeQueue; воркер исполняет команды по порядку.
 * Ошибка обработчика логируется и не доходит до публикующего.
 *
 * stop() закрывает очередь, дожидается доставки уже опубликованных
 * событий и останавливает воркер; start() после stop() снова принимает события.
 */
class InMemoryEventBus : public ports::output::IEventBus {
public:
    InMemoryEventBus() : running_(false), delivered_(0) {
        std::cout << "[InMemoryEventBus] Created" << std::endl;
    }

    ~InMemoryEventBus() override {
        stop();
    }

    void publish(const domain::DomainEvent& event) override {
        std::vector<ports::output::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(event.eventType);
            if (it == handlers_.end() || it->second.empty()) {
                return;
            }
            handlers = it->second;
        }

        std::shared_ptr<const domain::DomainEvent> copy(event.clone());
        auto command = std::make_shared<DispatchEventCommand>(std::move(copy), std::move(handlers));
        if (!queue_.push(command)) {
            std::cerr << "[InMemoryEventBus] Bus stopped, dropped " << event.eventType
                      << " " << event.eventId << std::endl;
        }
    }

    void subscribe(const std::string& eventType, ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_[eventType].push_back(std::move(handler));
    }

    void unsubscribe(const std::string& eventType) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_.erase(eventType);
    }

    bool hasSubscribers(const std::string& eventType) const override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() && !it->second.empty();
    }

    void start() override {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (running_) {
            return;
        }
        queue_.reopen();
        running_ = true;
        worker_ = std::thread([this]() { workerLoop(); });
        std::cout << "[InMemoryEventBus] Started" << std::endl;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (!running_) {
            return;
        }
        queue_.shutdown();
        if (worker_.joinable()) {
            worker_.join();
        }
        running_ = false;
        std::cout << "[InMemoryEventBus] Stopped, delivered " << delivered_.load() << " events" << std::endl;
    }

    bool isRunning() const {
        return running_;
    }

    size_t subscriberCount(const std::string& eventType) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /**
     * @brief Количество исполненных команд доставки
     */
    size_t deliveredCount() const {
        return delivered_.load();
    }

    /**
     * @brief Очистить все подписки (для тестов)
     */
    void clear() {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_.clear();
    }

private:
    void workerLoop() {
        while (auto command = queue_.pop()) {
            (*command)->execute();
            ++delivered_;
        }
    }

    mutable std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;

    std::mutex lifecycleMutex_;
    ThreadSafeQueue<std::shared_ptr<ICommand>> queue_;
    std::thread worker_;
    std::atomic<bool> running_;
    std::atomic<size_t> delivered_;
};

} // namespace accounting::adapters::secondary
