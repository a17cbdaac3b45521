#pragma once

/**
 * @file hatch.hpp
 * @brief Umbrella header for the hatch deployment engine
 *
 * hatch installs an application payload described by a manifest, registers
 * it with a hierarchical system store (file-type associations, launch
 * commands), creates launchers and reverses all of it on uninstall.
 *
 * Components, leaf first:
 *  - manifest.hpp     Manifest model and parser
 *  - tasks.hpp        Task selection
 *  - deploy.hpp       File deployment
 *  - plan.hpp         Store operation plan
 *  - integration.hpp  Transaction engine over store.hpp
 *  - journal.hpp      Uninstall journal and reversal
 *  - shortcuts.hpp    Desktop entry launchers
 *  - installer.hpp    Session facade
 */

#include "hatch/config.hpp"
#include "hatch/deploy.hpp"
#include "hatch/digest.hpp"
#include "hatch/expansion.hpp"
#include "hatch/install_record.hpp"
#include "hatch/installer.hpp"
#include "hatch/integration.hpp"
#include "hatch/journal.hpp"
#include "hatch/launcher.hpp"
#include "hatch/manifest.hpp"
#include "hatch/path_utils.hpp"
#include "hatch/plan.hpp"
#include "hatch/platform.hpp"
#include "hatch/privilege.hpp"
#include "hatch/result.hpp"
#include "hatch/semver.hpp"
#include "hatch/shortcuts.hpp"
#include "hatch/store.hpp"
#include "hatch/tasks.hpp"
#include "hatch/types.hpp"
#include "hatch/warnings.hpp"
