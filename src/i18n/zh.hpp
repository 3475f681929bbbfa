#pragma once

// Chinese string table - included by i18n.hpp after Strings is defined

inline constexpr Strings ZH_STRINGS_DEF = {
    // General
    "Phantom Tunnel 管理器",
    "状态: ",
    "服务: ",
    "已安装",
    "未安装",
    "运行中",
    "已停止",

    // Menu
    "安装或更新 Phantom Tunnel",
    "卸载 Phantom Tunnel",
    "重启服务",
    "停止服务",
    "查看服务状态",
    "查看实时日志",
    "退出",
    "请输入选项 [1-7]: ",
    "无效选项，请重试。",
    "按任意键返回菜单...",
    "正在退出。",

    // Install: dependencies
    "开始安装/更新 Phantom Tunnel...",
    "检查依赖: ",
    "依赖已满足。",
    "不支持的包管理器，假定以下工具已安装: ",
    "未找到支持的包管理器，且缺少必需工具: ",
    "依赖安装失败: ",

    // Install: release
    "不支持的架构: ",
    "正在从 GitHub 获取最新版本...",
    "无法从 GitHub 获取最新发布标签。",
    "最新版本为 ",
    "正在下载最新二进制文件: ",
    "下载失败，请检查 URL 和网络连接。",
    "二进制文件下载成功。",
    "无法创建临时下载目录。",

    // Install: files and unit
    "检测到正在运行的 Phantom 服务，更新前将先停止。",
    "正在安装可执行文件到 ",
    "安装可执行文件失败: ",
    "Phantom 二进制文件已安装/更新。",
    "正在配置 systemd 服务...",
    "写入服务文件失败: ",
    "systemd 服务文件已创建/更新。",

    // Install: first-run setup
    "首次设置: 请提供初始配置。",
    "请输入 Web 面板端口 (例如 8080): ",
    "端口号无效，安装已中止。",
    "请输入面板管理员用户名 [默认: ",
    "请输入面板管理员密码 [默认: ",
    "正在运行初始设置以配置数据库...",
    "初始设置失败，退出码 ",
    "已找到现有配置，跳过初始设置。",

    // Install: start
    "正在启用并启动 Phantom 服务...",
    "服务已启用并启动。",
    "安装/更新完成！",
    "Phantom Tunnel 正在运行！",
    "服务启动失败，请查看日志: journalctl -u ",

    // Uninstall
    "完全卸载 Phantom Tunnel",
    "警告: 这将删除二进制文件、所有配置文件、数据库以及 systemd 服务，且无法撤销。",
    "确定要继续吗? [y/N]: ",
    "已取消卸载。",
    "正在停止并禁用 Phantom 服务...",
    "服务已停止。",
    "服务已禁用。",
    "未找到 Phantom 服务，跳过。",
    "正在结束残留的 'phantom' 进程...",
    "正在删除 systemd 服务文件...",
    "systemd 已重新加载。",
    "正在删除可执行文件: ",
    "正在删除数据目录及其全部内容: ",
    "正在查找并删除旧版文件: ",
    "  - 删除旧版文件: ",
    "正在清理临时文件...",
    "删除失败: ",
    "Phantom Tunnel 已从系统中完全卸载。",
    "如果可执行文件安装在非标准路径，请手动删除。",

    // Service management
    "Phantom Tunnel 未安装，请先安装。",
    "正在重启 Phantom 服务...",
    "服务已重启。",
    "正在停止 Phantom 服务...",
    "显示 Phantom 服务状态...",
    "显示实时日志... (按 Ctrl+C 退出)",

    // Errors
    "命令执行失败: ",
    "无效的服务名称: ",
    "此程序必须以 root 身份运行，请使用 'sudo phantom-manager'。",
};
