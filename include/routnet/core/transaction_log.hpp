#ifndef ROUTNET_CORE_TRANSACTION_LOG_HPP
#define ROUTNET_CORE_TRANSACTION_LOG_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace routnet
{
    namespace core
    {
        class Logger;

        /**
         * Reversing action recorded right after a mutation succeeded
         */
        struct Compensation
        {
            std::string description;
            std::function<void()> action;
        };

        /**
         * Transaction Log
         *
         * Ordered stack of compensations for every change made to kernel and
         * network state during a run. Drained strictly in reverse order on
         * shutdown or on a failed start. A compensation that throws is logged
         * and skipped; draining always runs to the bottom of the stack.
         * Owned by the running process, never persisted.
         */
        class TransactionLog
        {
        public:
            TransactionLog();
            ~TransactionLog();

            TransactionLog(const TransactionLog &) = delete;
            TransactionLog &operator=(const TransactionLog &) = delete;

            void push(const std::string &description, std::function<void()> action);

            // Runs every pending compensation, newest first. Returns how many ran.
            size_t drain();

            size_t size() const { return entries_.size(); }
            bool empty() const { return entries_.empty(); }

            // Pending descriptions, oldest first
            std::vector<std::string> descriptions() const;

        private:
            std::vector<Compensation> entries_;
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace routnet

#endif // ROUTNET_CORE_TRANSACTION_LOG_HPP
