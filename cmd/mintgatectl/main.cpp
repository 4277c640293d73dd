#include <cstdlib>
#include <iostream>
#include <string>

#include "client/cpp/mintgate_client.h"
#include "internal/http/json_codec.hpp"
#include "mintgate/v1.hpp"

using namespace mintgate::v1;
using mintgate::client::MintgateClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  mintgatectl <url> describe [payer]\n"
            << "  mintgatectl <url> confirm-tx <resource> <tx_hash>\n"
            << "  mintgatectl <url> confirm-payer <resource> <payer>\n"
            << "  mintgatectl <url> confirm-header <resource> <payer>\n"
            << "\n"
            << "  <url> is http://host:port; MINTGATE_PATH overrides the endpoint path (default /api/402)\n";
}

template <typename Reply>
static int Print(const Reply& reply) {
  if (reply.body) {
    std::cout << mintgate::http::ToJson(*reply.body) << "\n";
    return 0;
  }
  std::cerr << "HTTP " << reply.status;
  if (reply.error) {
    std::cerr << " " << reply.error->fault() << ": " << reply.error->error();
    for (const auto& [key, value] : reply.error->details()) {
      std::cerr << "\n  " << key << "=" << value;
    }
  }
  std::cerr << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string url  = argv[1];
  const std::string cmd  = argv[2];
  const char*       path = std::getenv("MINTGATE_PATH");

  try {
    MintgateClient client(url, path ? path : "/api/402");

    // ------------------------------------------------------------

    if (cmd == "describe") {
      return Print(client.Describe(argc >= 4 ? argv[3] : ""));
    }

    // ------------------------------------------------------------

    if (cmd == "confirm-tx" || cmd == "confirm-payer" || cmd == "confirm-header") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      ConfirmPaymentRequest req;
      req.set_resource(argv[3]);

      std::string header;
      if (cmd == "confirm-tx") {
        req.set_tx_hash(argv[4]);
      } else if (cmd == "confirm-payer") {
        req.set_payer(argv[4]);
      } else {
        header = argv[4];
      }

      return Print(client.Confirm(req, header));
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
