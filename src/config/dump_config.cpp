/***
 * Name: cmfmt::config::DumpConfig
 * Purpose: Write the effective configuration in the loader's file format.
 */
#include "config/ConfigLoader.h"

namespace cmfmt::config {

void DumpConfig(std::ostream& os, const Configuration& cfg) {
  for (const auto& field : ConfigFields()) {
    os << "# " << field.doc << '\n';
    os << field.name << " = " << field.get(cfg).render() << "\n\n";
  }
  os << "# Specify structure for custom cmake functions\n";
  os << "additional_commands = " << cfg.get("additional_commands").render() << "\n\n";
  os << "# A dictionary containing any per-command configuration overrides.\n";
  os << "per_command = " << cfg.get("per_command").render() << '\n';
}

} // namespace cmfmt::config
