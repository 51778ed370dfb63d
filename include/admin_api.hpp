#pragma once

namespace httplib {
class Server;
}
class CentralAuthority;
class Auth;
class TcpLineServer;

// 注册管理接口路由：状态查询需要令牌，开关操作需要 admin 角色
void setupAdminRoutes(httplib::Server& svr, CentralAuthority& central, Auth& auth, const TcpLineServer& lanes);
