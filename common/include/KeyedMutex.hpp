#pragma once

#include <unordered_map>
#include <memory>
#include <mutex>
#include <string>

/**
 * @file KeyedMutex.hpp
 * @brief Набор мьютексов, адресуемых строковым ключом
 * @details
 * Сериализует операции над одним и тем же ключом, не блокируя
 * операции над разными ключами.
 *
 * Запись ключа считает владельца и ожидающих; последний Guard,
 * освободивший ключ, удаляет запись из реестра. Число записей
 * ограничено числом ключей, захваченных в данный момент.
 */
class KeyedMutex {
private:
    struct Slot {
        std::mutex mutex;
        size_t users = 0;   ///< владелец + ожидающие, под registryMutex_
    };

public:
    /**
     * @brief RAII-захват мьютекса конкретного ключа
     */
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key, std::shared_ptr<Slot> slot)
            : owner_(owner), key_(std::move(key)), slot_(std::move(slot))
        {
            slot_->mutex.lock();
        }

        ~Guard() {
            slot_->mutex.unlock();
            owner_.release(key_);
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        KeyedMutex& owner_;
        std::string key_;
        std::shared_ptr<Slot> slot_;
    };

    KeyedMutex() = default;

    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    /**
     * @brief Захватить мьютекс ключа (блокирующий вызов)
     */
    Guard lock(const std::string& key) {
        return Guard(*this, key, acquire(key));
    }

    /**
     * @brief Количество ключей, которые сейчас захвачены или ожидаются
     */
    size_t size() const {
        std::lock_guard<std::mutex> lock(registryMutex_);
        return slots_.size();
    }

private:
    std::shared_ptr<Slot> acquire(const std::string& key) {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto& slot = slots_[key];
        if (!slot) {
            slot = std::make_shared<Slot>();
        }
        ++slot->users;
        return slot;
    }

    void release(const std::string& key) {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto it = slots_.find(key);
        if (it != slots_.end() && --it->second->users == 0) {
            slots_.erase(it);
        }
    }

    mutable std::mutex registryMutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};
