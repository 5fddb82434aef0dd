#pragma once

#include <chrono>
#include <cstddef>

namespace forge
{
// Network variants with different genesis wallets and milestones
enum class forge_networks
{
	// Publicly known genesis keys, block rewards start early
	forge_test_network,
	// Beta genesis keys, live milestones
	forge_beta_network,
	// Live genesis keys and milestones
	forge_live_network
};
forge::forge_networks const forge_network = forge_networks::ACTIVE_NETWORK;
}
