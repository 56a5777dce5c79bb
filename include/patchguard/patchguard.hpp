/**
 * @file patchguard.hpp
 * @brief Installer patch integrity checking
 *
 * Compares the file and registry libraries recorded at the last release with
 * the current installer manifest and the freshly built files, and reports
 * everything that would make a patch fail.
 *
 * ## Example
 *
 * ```cpp
 * #include <patchguard/patchguard.hpp>
 *
 * auto primary = patchguard::load_manifest_source("Installer/Files.wxs");
 * auto library = patchguard::load_library_snapshot("Installer/FileLibrary.xml",
 *                                                  "Installer/RegLibrary.xml");
 * if (!primary.ok || !library.ok) return 1;
 *
 * patchguard::ManifestIndex index({primary.source}, "/src/project");
 * patchguard::DiskFileProbe probe;
 *
 * patchguard::ReconcileOptions options;
 * options.project_root = "/src/project";
 * options.build_flavor = "Release";
 *
 * auto log = patchguard::reconcile(index, library.snapshot, probe, options);
 * std::cout << patchguard::render_report(log);
 * ```
 */

#pragma once

#include "patchguard/check.hpp"
#include "patchguard/config.hpp"
#include "patchguard/diagnostics.hpp"
#include "patchguard/digest.hpp"
#include "patchguard/file_probe.hpp"
#include "patchguard/fragment.hpp"
#include "patchguard/library_snapshot.hpp"
#include "patchguard/manifest_index.hpp"
#include "patchguard/platform.hpp"
#include "patchguard/reconcile.hpp"
#include "patchguard/report.hpp"
#include "patchguard/source_control.hpp"
#include "patchguard/version_ordinal.hpp"
