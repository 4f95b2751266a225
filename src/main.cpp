#include "app/Application.hpp"

int main(int argc, char** argv)
{
    return lexanon::app::Application{ argc, argv }.run();
}
