#pragma once

#include <memory>
#include <string>

namespace mintgate::core {
class MintOrchestrator;
}
namespace mintgate::payment {
class RequirementBuilder;
}

namespace mintgate::service {

/*
  Dependency container shared by all services.

  orchestrator is null when the signing key or the NFT contract address is
  not configured; the describe path keeps working in that state.
*/
struct ServiceContext {
  std::shared_ptr<mintgate::payment::RequirementBuilder> requirements;
  std::shared_ptr<mintgate::core::MintOrchestrator>      orchestrator;

  std::string resource;
};

} // namespace mintgate::service
