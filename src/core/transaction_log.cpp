#include "routnet/core/transaction_log.hpp"
#include "routnet/core/logger.hpp"

#include <exception>

namespace routnet
{
    namespace core
    {

        TransactionLog::TransactionLog()
            : logger_(get_logger("TransactionLog"))
        {
        }

        TransactionLog::~TransactionLog()
        {
            if (!entries_.empty())
            {
                logger_->warning("Transaction log destroyed with pending compensations, draining",
                                 LogContext().add("pending", entries_.size()));
                drain();
            }
        }

        void TransactionLog::push(const std::string &description, std::function<void()> action)
        {
            logger_->debug("Registered compensation",
                           LogContext().add("step", entries_.size() + 1).add("undo", description));
            entries_.push_back(Compensation{description, std::move(action)});
        }

        size_t TransactionLog::drain()
        {
            size_t executed = 0;

            while (!entries_.empty())
            {
                // Pop before running so a compensation can never run twice
                Compensation entry = std::move(entries_.back());
                entries_.pop_back();

                logger_->info("Rolling back", LogContext().add("undo", entry.description));
                ++executed;

                if (!entry.action)
                {
                    continue;
                }

                try
                {
                    entry.action();
                }
                catch (const std::exception &e)
                {
                    logger_->warning("Compensation failed, continuing teardown",
                                     LogContext().add("undo", entry.description).add("error", e.what()));
                }
            }

            return executed;
        }

        std::vector<std::string> TransactionLog::descriptions() const
        {
            std::vector<std::string> result;
            result.reserve(entries_.size());
            for (const auto &entry : entries_)
            {
                result.push_back(entry.description);
            }
            return result;
        }

    } // namespace core
} // namespace routnet
