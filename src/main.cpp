#include <echo_service/Service.h>

auto main() -> int
{
    return runService();
}
