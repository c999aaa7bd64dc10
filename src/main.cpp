#include "retriever/cli.hpp"

int main(int argc, char** argv) {
    return retriever::runCli(argc, argv);
}
