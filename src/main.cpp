#include "application.hpp"

int main(int argc, char *argv[]) {
    g_autoptr(EncoreApplication) app = encore_application_new();
    return g_application_run(G_APPLICATION(app), argc, argv);
}
