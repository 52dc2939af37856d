#include "app/RagForgeApp.hpp"

int main(int argc, char** argv) {
    ragforge::app::RagForgeApp app;
    return app.Run(argc, argv);
}
