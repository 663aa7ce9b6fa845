#pragma once

namespace harvest {

// Installs SIGINT/SIGTERM handlers. The first signal only raises the stop request so
// the run can stop admitting work and drain; a second one exits at once with 128+sig.
void termination_handler_install();

bool termination_requested();
void termination_request();  // same effect as the first signal
void termination_reset();

}  // namespace harvest
