#pragma once

#include <core/types.hpp>

// Interactive login shell on the profile's host, started in its remote dir.
// Takes over the terminal until the shell exits; returns ssh's exit code.
int open_remote_shell(const SyncProfile& profile);
