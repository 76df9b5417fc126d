#include <mutex>
#include "pred2D.hh"

void predicates_init()
{
    static std::once_flag flag;
    std::call_once(flag, [] { exactinit(); });
}
