#include "kvwire/errors.h"

#include <iostream>

namespace kvwire
{
    std::ostream &operator<<(std::ostream &o, const KvError err)
    {
        switch (err)
        {
            case KvError::success:
                return o << "KvError::success";
            case KvError::invalid_frame:
                return o << "KvError::invalid_frame";
            case KvError::incomplete_frame:
                return o << "KvError::incomplete_frame";
            case KvError::unknown_frame_id:
                return o << "KvError::unknown_frame_id";
            case KvError::atoi:
                return o << "KvError::atoi";
            case KvError::eof:
                return o << "KvError::eof";
            case KvError::not_enough_data:
                return o << "KvError::not_enough_data";
            case KvError::generic_network_error:
                return o << "KvError::generic_network_error";
            case KvError::max_recursion_depth:
                return o << "KvError::max_recursion_depth";
            case KvError::frame_too_large:
                return o << "KvError::frame_too_large";
        }
        return o << "kvwire::KvError::unknown";
    }
}  // namespace kvwire
