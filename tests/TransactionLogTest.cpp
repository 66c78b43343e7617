#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "routnet/core/logger.hpp"
#include "routnet/core/transaction_log.hpp"
#include "Fakes.hpp"

using routnet::core::TransactionLog;
using routnet::testing::expect;

int main()
{
    int test_result_code = EXIT_SUCCESS;
    routnet::core::setup_logging(routnet::core::LogLevel::ERROR);

    std::cout << "--- routnet Transaction Log Test ---" << std::endl;

    // --- Test 1: Drain runs newest first ---
    std::cout << "\nTEST 1: Compensations run in reverse order..." << std::endl;
    {
        TransactionLog log;
        std::vector<std::string> order;
        log.push("delete interface ap0", [&order]() { order.push_back("interface"); });
        log.push("remove rule", [&order]() { order.push_back("rule"); });
        log.push("tear down shaping", [&order]() { order.push_back("shaping"); });

        expect(log.size() == 3, "three compensations pending", test_result_code);
        expect(log.descriptions().front() == "delete interface ap0", "descriptions listed oldest first", test_result_code);

        const size_t ran = log.drain();
        expect(ran == 3, "drain reports three compensations", test_result_code);
        expect(order == std::vector<std::string>({"shaping", "rule", "interface"}), "order is shaping, rule, interface",
               test_result_code);
        expect(log.empty(), "log is empty after drain", test_result_code);
    }

    // --- Test 2: A failing compensation does not stop the drain ---
    std::cout << "\nTEST 2: Failing compensation is skipped..." << std::endl;
    {
        TransactionLog log;
        int ran_first = 0;
        log.push("first", [&ran_first]() { ++ran_first; });
        log.push("broken", []() { throw std::runtime_error("device vanished"); });

        const size_t ran = log.drain();
        expect(ran == 2, "both entries were attempted", test_result_code);
        expect(ran_first == 1, "entry below the failure still ran", test_result_code);
    }

    // --- Test 3: Drain is idempotent ---
    std::cout << "\nTEST 3: Second drain does nothing..." << std::endl;
    {
        TransactionLog log;
        int count = 0;
        log.push("once", [&count]() { ++count; });
        log.drain();
        expect(log.drain() == 0, "second drain runs nothing", test_result_code);
        expect(count == 1, "compensation ran exactly once", test_result_code);
    }

    // --- Test 4: Destruction drains pending entries ---
    std::cout << "\nTEST 4: Destructor drains..." << std::endl;
    {
        int count = 0;
        {
            TransactionLog log;
            log.push("pending", [&count]() { ++count; });
        }
        expect(count == 1, "pending compensation ran on destruction", test_result_code);
    }

    std::cout << "\n--- routnet Transaction Log Test Finished ---" << std::endl;
    return test_result_code;
}
