#include "crypto.hpp"
#include "encoding.hpp"
#include "ordercodec.hpp"
#include "programconfig.hpp"
#include "signing.hpp"

#include <iostream>
#include <string>

using namespace ordermill;

namespace {

void printUsage()
{
    std::cout << "Usage: ordermill <command> [args]" << std::endl;
    std::cout << "  keygen                         generate an Ed25519 key pair" << std::endl;
    std::cout << "  hash <full-order-hex>          print the order hash" << std::endl;
    std::cout << "  verify <full-order-hex> <now>  check signature and expiry" << std::endl;
    std::cout << "  compact <full-order-hex>       print the compact encoding" << std::endl;
    std::cout << "  config [path]                  load and print program identities" << std::endl;
}

const char* sideName(Side side) { return side == Side::Bid ? "bid" : "ask"; }

void printOrder(const Order& order)
{
    std::cout << "Order " << order.nonce << " (" << sideName(order.side) << ") by "
              << encoding::toBase58(order.maker) << std::endl;
    std::cout << " - orderbook:    " << codec::orderbookId(order) << std::endl;
    std::cout << " - maker amount: " << order.makerAmount << std::endl;
    std::cout << " - taker amount: " << order.takerAmount << std::endl;
    std::cout << " - expiration:   " << order.expiration << std::endl;
}

Order decodeArgument(const std::string& hex) { return codec::decodeFull(encoding::fromHex(hex)); }

int runKeygen()
{
    auto keypair = crypto::Keypair::generate();
    std::cout << "public key: " << encoding::toBase58(keypair.publicKey()) << std::endl;
    std::cout << "seed:       " << encoding::toHex(keypair.seed()) << std::endl;
    return 0;
}

int runHash(const std::string& hex)
{
    Order order = decodeArgument(hex);
    printOrder(order);
    std::cout << "hash: " << encoding::toHex(codec::hash(order)) << std::endl;
    return 0;
}

int runVerify(const std::string& hex, const std::string& nowText)
{
    Order order = decodeArgument(hex);
    Timestamp now = std::stoull(nowText);
    printOrder(order);

    bool signatureOk = signing::verify(order);
    bool expired = signing::isExpired(order, now);
    std::cout << "signature: " << (order.isSigned() ? (signatureOk ? "valid" : "INVALID") : "missing") << std::endl;
    std::cout << "expired:   " << (expired ? "yes" : "no") << std::endl;
    return signatureOk && !expired ? 0 : 2;
}

int runCompact(const std::string& hex)
{
    Order order = decodeArgument(hex);
    printOrder(order);
    if ((order.nonce >> 32) != 0) {
        std::cout << "Warning: nonce " << order.nonce << " does not fit in 32 bits; compact form keeps "
                  << static_cast<uint32_t>(order.nonce) << std::endl;
    }
    std::cout << "compact: " << encoding::toHex(codec::encodeCompact(codec::toCompact(order))) << std::endl;
    return 0;
}

int runConfig(const std::string& path)
{
    std::cout << "Loading config from " << path << "..." << std::endl;
    ProgramConfig config = ProgramConfig::loadFromFile(path);
    std::cout << " - settlement program:       " << encoding::toBase58(config.settlementProgram) << std::endl;
    std::cout << " - verifier program:         " << encoding::toBase58(config.verifierProgram) << std::endl;
    std::cout << " - token program:            " << encoding::toBase58(config.tokenProgram) << std::endl;
    std::cout << " - associated token program: " << encoding::toBase58(config.associatedTokenProgram) << std::endl;
    std::cout << " - system program:           " << encoding::toBase58(config.systemProgram) << std::endl;
    std::cout << " - instructions sysvar:      " << encoding::toBase58(config.instructionsSysvar) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        if (argc < 2) {
            printUsage();
            return 1;
        }

        const std::string command = argv[1];

        if (command == "keygen")
            return runKeygen();
        if (command == "hash" && argc > 2)
            return runHash(argv[2]);
        if (command == "verify" && argc > 3)
            return runVerify(argv[2], argv[3]);
        if (command == "compact" && argc > 2)
            return runCompact(argv[2]);
        if (command == "config")
            return runConfig(argc > 2 ? argv[2] : "config/programs.json");

        printUsage();
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
