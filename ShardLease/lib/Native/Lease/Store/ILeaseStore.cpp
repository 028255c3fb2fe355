#include "ILeaseStore.hpp"

#include "Global/Misc/Overloaded.hpp"

std::string_view DescribeWriteResult(const LeaseWriteResult& result)
{
	return std::visit(Overloaded{[](const LeaseWriteSuccess&) -> std::string_view { return "Success"; },
								 [](const LeaseTokenMismatch&) -> std::string_view
								 { return "TokenMismatch"; },
								 [](const LeaseNotFound&) -> std::string_view { return "NotFound"; },
								 [](const LeaseStoreFailure&) -> std::string_view
								 { return "StoreFailure"; }},
					  result);
}
