#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "test_helpers.hpp"

using namespace geowkb;

int main(int argc, char *argv[]) {
	// start every run from an empty scratch directory
	auto dir = TestDirectoryPath();
	try {
		TestDeleteDirectory(dir);
		TestCreateDirectory(dir);
	} catch (std::exception &ex) {
		fprintf(stderr, "Failed to create testing directory \"%s\": %s\n", dir.c_str(), ex.what());
		return 1;
	}

	int result = Catch::Session().run(argc, argv);

	try {
		TestDeleteDirectory(dir);
	} catch (std::exception &ex) {
		fprintf(stderr, "Failed to clean up testing directory \"%s\": %s\n", dir.c_str(), ex.what());
	}
	return result;
}
