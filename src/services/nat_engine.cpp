#include "routnet/services/nat_engine.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/transaction_log.hpp"
#include "routnet/infrastructure/firewall.hpp"
#include "routnet/infrastructure/sysctl.hpp"

namespace routnet
{
    namespace services
    {

        NatEngine::NatEngine(infrastructure::FirewallBackend *backend,
                             infrastructure::SysctlControl &sysctl,
                             core::TransactionLog &log)
            : backend_(backend), sysctl_(sysctl), log_(log), logger_(core::get_logger("NatEngine"))
        {
        }

        std::string NatEngine::backend_name() const
        {
            return backend_ ? backend_->name() : "none";
        }

        std::vector<std::string> NatEngine::render_rules(const std::string &wan, const std::string &ap) const
        {
            std::vector<std::string> statements;
            if (!backend_)
            {
                return statements;
            }
            for (const auto &rule : infrastructure::build_nat_rule_set(wan, ap))
            {
                statements.push_back(backend_->render(rule));
            }
            return statements;
        }

        void NatEngine::apply_rules(const std::string &wan, const std::string &ap)
        {
            if (!backend_)
            {
                throw core::HotspotError(core::ErrorCode::RuleApplyFailed, "neither nft nor iptables is available");
            }

            auto *backend = backend_;
            try
            {
                if (backend->prepare())
                {
                    log_.push("remove " + backend->name() + " table", [backend]()
                              { backend->release(); });
                }

                int inserted = 0;
                for (const auto &rule : infrastructure::build_nat_rule_set(wan, ap))
                {
                    if (backend->rule_exists(rule))
                    {
                        logger_->debug("Rule already present", core::LogContext().add("rule", rule.describe()));
                        continue;
                    }

                    backend->insert_rule(rule);
                    log_.push("remove rule " + rule.describe(), [backend, rule]()
                              { backend->remove_rule(rule); });
                    ++inserted;
                }

                logger_->info("NAT rules applied",
                              core::LogContext()
                                  .add("backend", backend->name())
                                  .add("wan", wan)
                                  .add("ap", ap)
                                  .add("inserted", inserted));
            }
            catch (const core::HotspotError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw core::HotspotError(core::ErrorCode::RuleApplyFailed, e.what());
            }
        }

        void NatEngine::enable_forwarding()
        {
            const auto current = sysctl_.read(FORWARDING_KEY);
            if (!current)
            {
                throw core::HotspotError(core::ErrorCode::RuleApplyFailed,
                                         std::string("cannot read ") + FORWARDING_KEY);
            }

            if (*current != "0")
            {
                logger_->debug("IPv4 forwarding already enabled");
                return;
            }

            try
            {
                sysctl_.write(FORWARDING_KEY, "1");
            }
            catch (const std::exception &e)
            {
                throw core::HotspotError(core::ErrorCode::RuleApplyFailed, e.what());
            }

            auto &sysctl = sysctl_;
            log_.push("disable IPv4 forwarding", [&sysctl]()
                      { sysctl.write(FORWARDING_KEY, "0"); });
            logger_->info("IPv4 forwarding enabled");
        }

    } // namespace services
} // namespace routnet
