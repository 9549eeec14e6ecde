#include "app/CasefileApp.hpp"

int main(int argc, char** argv) {
    casefile::app::CasefileApp app;
    return app.Run(argc, argv);
}
