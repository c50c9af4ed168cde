#pragma once
#include "io/writer_layer.hpp"
#include "config/transfer_config.hpp"
#include "limiter/dynamic_rate_limiter.hpp"
#include "limiter/unit_boundaries.hpp"

// Пропускает самый длинный допустимый префикс буфера.
// Конфигурация читается только в начале каждого вызова, поэтому изменение
// видно не позже следующей записи и никогда посреди нее.
template<typename NextLayer>
class Rate_limited_writer : public Writer_layer<Rate_limited_writer<NextLayer>, NextLayer>
{
    public:
        Rate_limited_writer(NextLayer next, Config_monitor monitor)
        : Writer_layer<Rate_limited_writer<NextLayer>, NextLayer>(std::forward<NextLayer>(next)),
          monitor_(std::move(monitor))
        {
            auto config = monitor_.get_if_new().value_or(monitor_.get());
            limiter_ = Dynamic_rate_limiter(config.limit());
            unit_ = config.unit;
        }

        std::size_t write_chunk(boost::asio::const_buffer chunk, boost::system::error_code& ec)
        {
            update_config();
            auto data = this->as_span(chunk);
            auto admission = admit(data);
            auto written = this->next_.write_some(boost::asio::buffer(chunk.data(), admission.end), ec);
            if(admission.granted > 0 && written < admission.end) // токены за непереданные единицы возвращаем
                limiter_.refund(admission.granted - Unit_boundaries(data.first(written), unit_).count());
            if(ec)
                return written;
            if(written < admission.end) // внутренний слой взял меньше - проталкиваем то, что он уже принял
                this->next_.flush(ec);
            return written;
        }

        const Dynamic_rate_limiter& limiter() const {return limiter_;};

        Unit unit() const {return unit_;};

    private:
        void update_config()
        {
            if(auto config = monitor_.get_if_new())
            {
                limiter_.set_limit(config->limit());
                unit_ = config->unit;
            }
        }

        struct Admission
        {
            std::size_t end; // длина допустимого префикса
            std::size_t granted; // сколько токенов списано
        };

        Admission admit(std::span<const char> data)
        {
            if(!limiter_.limited())
                return {data.size(), 0};
            Unit_boundaries boundaries(data, unit_);
            if(boundaries.count() == 0) // ни одной целой единицы - не ограничиваем
                return {data.size(), 0};
            auto granted = limiter_.request(boundaries.count());
            return {boundaries.prefix_end(granted), granted};
        }

    private:
        Config_monitor monitor_;

        Dynamic_rate_limiter limiter_;

        Unit unit_ = Unit::Byte;
};
