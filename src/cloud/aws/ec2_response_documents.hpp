#pragma once

#include <aws/core/utils/memory/stl/AWSVector.h>
#include <aws/ec2/model/Reservation.h>
#include <aws/ec2/model/RouteTable.h>
#include <aws/ec2/model/Subnet.h>
#include <aws/sts/model/GetCallerIdentityResult.h>

#include <string>

namespace netstack::cloud::aws {

// Renders SDK response models back into the provider's JSON layout (the
// shape `aws ec2 describe-*` prints). Members the response did not carry are
// left out; everything it did carry is written, with reservation grouping
// intact. Pages are concatenated by the caller before rendering.
std::string RenderCallerIdentity(const Aws::STS::Model::GetCallerIdentityResult& result);
std::string RenderReservations(const Aws::Vector<Aws::EC2::Model::Reservation>& reservations);
std::string RenderSubnets(const Aws::Vector<Aws::EC2::Model::Subnet>& subnets);
std::string RenderRouteTables(const Aws::Vector<Aws::EC2::Model::RouteTable>& tables);

} // namespace netstack::cloud::aws
