// канал "последнее значение побеждает": один отправитель, много получателей
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace watch_detail
{
    template<typename T>
    struct Shared_slot
    {
        explicit Shared_slot(T initial) : value(std::move(initial)) {}

        std::mutex mutex; // защищает value и version
        T value; // текущее значение
        std::uint64_t version = 1; // растет при каждом send
    };
}

template<typename T>
class Watch_receiver
{
    public:
        explicit Watch_receiver(std::shared_ptr<watch_detail::Shared_slot<T>> slot)
        : slot_(std::move(slot))
        {}

        T get() const // последнее отправленное значение
        {
            std::lock_guard lock(slot_->mutex);
            return slot_->value;
        }

        std::optional<T> get_if_new() // значение, если этот получатель его еще не видел через get_if_new
        {
            std::lock_guard lock(slot_->mutex);
            if(slot_->version == seen_version_)
                return std::nullopt;
            seen_version_ = slot_->version;
            return slot_->value;
        }

    private:
        std::shared_ptr<watch_detail::Shared_slot<T>> slot_;

        std::uint64_t seen_version_ = 0; // 0 - еще ничего не видели
};

template<typename T>
class Watch_sender
{
    public:
        explicit Watch_sender(T initial)
        : slot_(std::make_shared<watch_detail::Shared_slot<T>>(std::move(initial)))
        {}

        void send(T value) // заменяет значение для всех получателей, никогда не ждет получателей
        {
            std::lock_guard lock(slot_->mutex);
            slot_->value = std::move(value);
            ++slot_->version;
        }

        Watch_receiver<T> subscribe() const
        {
            return Watch_receiver<T>(slot_);
        }

    private:
        std::shared_ptr<watch_detail::Shared_slot<T>> slot_;
};

template<typename T>
std::pair<Watch_sender<T>, Watch_receiver<T>> make_watch_channel(T initial)
{
    Watch_sender<T> sender(std::move(initial));
    auto receiver = sender.subscribe();
    return {std::move(sender), std::move(receiver)};
}
