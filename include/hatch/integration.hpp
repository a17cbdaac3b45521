#pragma once

#include "hatch/journal.hpp"
#include "hatch/result.hpp"
#include "hatch/store.hpp"
#include "hatch/types.hpp"
#include "hatch/warnings.hpp"

#include <string>

namespace hatch {

// ============================================================================
// OS-Integration Transaction Engine
// ============================================================================

struct IntegrationReport {
    size_t applied = 0;    // operations written to the store
    size_t unchanged = 0;  // list members already holding our data
    size_t journaled = 0;  // new journal entries
};

class IntegrationEngine {
public:
    IntegrationEngine(SystemStore& store, UninstallJournal& journal, WarningCollector& warnings)
        : store_(store), journal_(journal), warnings_(warnings) {}

    // Apply the plan in order. For each operation the prior state is read,
    // the new data written, and only then the journal entry committed. The
    // first failure stops the run with INTEGRATION_ERROR; operations already
    // applied stay in the store and in the journal.
    //
    // An operation identical to one already journaled for install_id (a
    // re-install) is applied but not journaled again.
    Result<IntegrationReport> apply(const IntegrationPlan& plan,
                                    const std::string& install_id,
                                    const std::string& run_id);

private:
    SystemStore& store_;
    UninstallJournal& journal_;
    WarningCollector& warnings_;
};

} // namespace hatch
