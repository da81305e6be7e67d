#include <iostream>

#include <glog/logging.h>

#include "bootstrap_cli.h"

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	return Bootstrap::RunBootstrap(argc, argv, std::cout);
}
