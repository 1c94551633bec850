#include "app/BundleSyncApp.hpp"

int main(int argc, char** argv) {
    bundlesync::app::BundleSyncApp app;
    return app.Run(argc, argv);
}
